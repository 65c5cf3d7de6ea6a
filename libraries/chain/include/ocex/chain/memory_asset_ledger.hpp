#pragma once
#include <ocex/chain/asset_ledger.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace ocex { namespace chain {
   using namespace boost::multi_index;

   struct ledger_asset_object
   {
      asset_id_type   id;
      account_id_type owner;
      share_type      supply;
   };

   struct ledger_balance_object
   {
      account_id_type owner;
      asset_id_type   asset;
      share_type      balance;
   };

   struct by_asset_id;
   struct by_owner_asset;

   using ledger_asset_multi_index_type = multi_index_container<
      ledger_asset_object,
      indexed_by<
         ordered_unique< tag<by_asset_id>, member<ledger_asset_object, asset_id_type, &ledger_asset_object::id> >
      >
   >;

   using ledger_balance_multi_index_type = multi_index_container<
      ledger_balance_object,
      indexed_by<
         ordered_unique< tag<by_owner_asset>,
            composite_key<ledger_balance_object,
               member<ledger_balance_object, account_id_type, &ledger_balance_object::owner>,
               member<ledger_balance_object, asset_id_type, &ledger_balance_object::asset>
            >
         >
      >
   >;

   /**
    * @brief In-process asset ledger.
    *
    * The native asset always exists; tokens must be created before they can be held.
    */
   class memory_asset_ledger : public asset_ledger
   {
      public:
         memory_asset_ledger();

         void create_asset( const asset_id_type& asset, const account_id_type& owner );

         bool asset_exists( const asset_id_type& asset ) const;

         /// credits `amount` without a counterpart, as a genesis allocation
         void set_balance( const asset_id_type& asset, const account_id_type& who, share_type amount );

         void transfer( const account_id_type& from, const account_id_type& to,
                        const asset_id_type& asset, share_type amount ) override;

         void mint( const asset_id_type& asset, const account_id_type& to, share_type amount ) override;

         void burn( const asset_id_type& asset, const account_id_type& from, share_type amount ) override;

         share_type balance_of( const asset_id_type& asset, const account_id_type& who ) const override;

         share_type total_supply( const asset_id_type& asset ) const;

      private:
         void adjust_balance( const account_id_type& who, const asset_id_type& asset, share_type delta );

         ledger_asset_multi_index_type   _assets;
         ledger_balance_multi_index_type _balances;
   };

} } // ocex::chain

FC_REFLECT( ocex::chain::ledger_asset_object, (id)(owner)(supply) )
FC_REFLECT( ocex::chain::ledger_balance_object, (owner)(asset)(balance) )
