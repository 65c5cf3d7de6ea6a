#pragma once
#include <ocex/chain/protocol/trading_pair.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace ocex { namespace chain {
   using namespace boost::multi_index;

   /**
    * @class trading_pair_object
    * @brief A registered market and whether it currently accepts orders.
    */
   class trading_pair_object
   {
      public:
         asset_id_type     base;
         asset_id_type     quote;
         trading_pair_info info;
   };

   struct by_assets;
   using trading_pair_multi_index_type = multi_index_container<
      trading_pair_object,
      indexed_by<
         ordered_unique< tag<by_assets>,
            composite_key<trading_pair_object,
               member<trading_pair_object, asset_id_type, &trading_pair_object::base>,
               member<trading_pair_object, asset_id_type, &trading_pair_object::quote>
            >
         >
      >
   >;

} } // ocex::chain

FC_REFLECT( ocex::chain::trading_pair_object, (base)(quote)(info) )
