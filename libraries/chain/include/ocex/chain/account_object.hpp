#pragma once
#include <ocex/chain/protocol/types.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace ocex { namespace chain {
   using namespace boost::multi_index;

   /**
    * @class account_object
    * @brief A main account allowed to trade on the exchange.
    *
    * The canonical encoding of this object is the leaf the enclave commits to in its
    * merkle mountain range, so the reflected field order must not change.
    */
   class account_object
   {
      public:
         account_id_type              main_account;
         /// includes main_account itself
         std::vector<account_id_type> proxies;

         bool has_proxy( const account_id_type& proxy ) const;
   };

   struct by_main_account;
   using account_multi_index_type = multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_main_account>,
            member<account_object, account_id_type, &account_object::main_account>
         >
      >
   >;

} } // ocex::chain

FC_REFLECT( ocex::chain::account_object, (main_account)(proxies) )
