#pragma once
#include <ocex/chain/protocol/types.hpp>

namespace ocex { namespace chain {

   /**
    * @brief The fungible asset ledger that actually holds balances.
    *
    * Implementations report failures by throwing exceptions derived from asset_ledger_exception;
    * the exchange propagates them unchanged to the caller of the operation.
    */
   class asset_ledger
   {
      public:
         virtual ~asset_ledger() {}

         virtual void transfer( const account_id_type& from, const account_id_type& to,
                                const asset_id_type& asset, share_type amount ) = 0;

         virtual void mint( const asset_id_type& asset, const account_id_type& to, share_type amount ) = 0;

         /// reverses a mint; used only when a failed operation is rolled back
         virtual void burn( const asset_id_type& asset, const account_id_type& from, share_type amount ) = 0;

         virtual share_type balance_of( const asset_id_type& asset, const account_id_type& who ) const = 0;
   };

} } // ocex::chain
