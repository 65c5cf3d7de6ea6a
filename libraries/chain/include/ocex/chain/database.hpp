#pragma once
#include <ocex/chain/account_object.hpp>
#include <ocex/chain/asset_ledger.hpp>
#include <ocex/chain/attestation_verifier.hpp>
#include <ocex/chain/bounded_vector.hpp>
#include <ocex/chain/enclave_object.hpp>
#include <ocex/chain/evaluator.hpp>
#include <ocex/chain/exchange_parameters.hpp>
#include <ocex/chain/snapshot_object.hpp>
#include <ocex/chain/trading_pair_object.hpp>
#include <ocex/chain/protocol/events.hpp>
#include <ocex/chain/protocol/ingress.hpp>
#include <ocex/chain/protocol/operations.hpp>

#include <map>
#include <memory>

namespace ocex { namespace chain {

   /**
    * The registries, flags and per block logs of the exchange. Asset balances live in the asset
    * ledger and accepted snapshots in the snapshot_store; neither is part of it.
    */
   struct ledger_state
   {
      account_multi_index_type              accounts;
      trading_pair_multi_index_type         trading_pairs;
      enclave_multi_index_type              enclaves;

      uint64_t                              snapshot_nonce = 0;
      bool                                  exchange_operational = true;

      uint32_t                              head_block_num = 0;
      fc::time_point_sec                    head_block_time;

      std::vector<ingress_message>          ingress_messages;
      std::vector<exchange_event>           events;
      bounded_vector<on_chain_event>        on_chain_events;
   };

   /**
    * @class database
    * @brief The exchange ledger: applies operations with an origin, all or nothing.
    */
   class database
   {
      public:
         database( asset_ledger& ledger, const attestation_verifier& verifier,
                   const exchange_parameters& params = exchange_parameters() );
         ~database();

         /**
          * @brief Starts a block.
          *
          * Clears the per block queues and the on-chain event log, which frees its capacity for
          * the calls of the new block. The logs are cleared for any @p block_num; the head block only
          * moves forward.
          */
         void on_initialize( uint32_t block_num, fc::time_point_sec block_time );

         /**
          * Applies one operation on behalf of @p origin. Either every effect of the operation is
          * kept, or the call throws and neither the ledger state nor the asset ledger changed.
          */
         void apply_operation( const origin_type& origin, const operation& op );

         void apply_call( const signed_call& call ) { apply_operation( call.origin, call.op ); }

         /**
          * Tracks the changes of one operation. Unless commit() is called, the destructor restores
          * the ledger state captured at construction, restores the snapshot store objects created or
          * modified through the database since then, and reverses the asset ledger calls made
          * through the database since then.
          *
          * The ledger state is copied whole, so its cost follows the number of registered accounts,
          * pairs and enclaves. The snapshot store grows with every accepted snapshot and is journaled
          * per object instead.
          */
         class undo_session
         {
            public:
               undo_session( undo_session&& mv );
               ~undo_session();

               void commit();
               void undo();

            private:
               friend class database;
               explicit undo_session( database& db );

               database&    _db;
               ledger_state _backup;
               bool         _apply_undo = true;
         };

         undo_session start_undo_session();

         /// @{ @group Getters
         const exchange_parameters& get_parameters() const { return _params; }
         const ledger_state&        get_state() const { return _state; }
         const snapshot_store&      get_snapshot_store() const { return _snapshot_store; }

         /// the account that holds all deposited funds
         const account_id_type& get_custodian_account() const { return _custodian; }

         uint32_t           head_block_num() const  { return _state.head_block_num; }
         fc::time_point_sec head_block_time() const { return _state.head_block_time; }

         uint64_t get_snapshot_nonce() const       { return _state.snapshot_nonce; }
         bool     is_exchange_operational() const  { return _state.exchange_operational; }

         const account_object*             find_account( const account_id_type& main ) const;
         const trading_pair_object*        find_trading_pair( const asset_id_type& base, const asset_id_type& quote ) const;
         const enclave_object*             find_enclave( const public_key_type& key ) const;
         const snapshot_object*            find_snapshot( uint64_t nonce ) const;
         const pending_withdrawals_object* find_pending_withdrawals( uint64_t nonce ) const;
         const fee_pool_object*            find_fee_pool( uint64_t nonce ) const;

         const std::vector<ingress_message>&   get_ingress_messages() const { return _state.ingress_messages; }
         const std::vector<exchange_event>&    get_events() const { return _state.events; }
         const bounded_vector<on_chain_event>& get_on_chain_events() const { return _state.on_chain_events; }

         /// Throws mmr_empty when no account is registered
         digest_type calculate_accounts_mmr_root() const;

         asset_ledger&               get_asset_ledger() const { return _ledger; }
         const attestation_verifier& get_attestation_verifier() const { return _verifier; }
         /// @}

         /// @{ @group Used by evaluators
         ledger_state& get_mutable_state() { return _state; }

         /// Stores the records of a newly accepted snapshot
         void create_snapshot_records( const snapshot_object& snapshot, const pending_withdrawals_object& pending,
                                       const fee_pool_object& pool );

         template<typename Lambda>
         void modify( const pending_withdrawals_object& obj, const Lambda& m )
         {
            if( _undo_enabled )
               _snapshot_journal.old_withdrawals.emplace( obj.nonce, obj );
            auto& idx = _snapshot_store.withdrawals.get<by_nonce>();
            idx.modify( idx.iterator_to( obj ), m );
         }

         template<typename Lambda>
         void modify( const fee_pool_object& obj, const Lambda& m )
         {
            if( _undo_enabled )
               _snapshot_journal.old_fee_pools.emplace( obj.nonce, obj );
            auto& idx = _snapshot_store.fee_pools.get<by_nonce>();
            idx.modify( idx.iterator_to( obj ), m );
         }

         void push_ingress_message( const ingress_message& msg );
         void push_event( const exchange_event& event );
         /// Throws on_chain_events_overflow when the log is full
         void push_on_chain_event( const on_chain_event& event );

         void transfer( const account_id_type& from, const account_id_type& to,
                        const asset_id_type& asset, share_type amount );
         void mint( const asset_id_type& asset, const account_id_type& to, share_type amount );
         /// @}

         static account_id_type derive_custodian_account( const std::string& module_id );

      private:
         struct ledger_journal_entry
         {
            enum class action_kind { transfer, mint };

            action_kind     action;
            account_id_type from;
            account_id_type to;
            asset_id_type   asset;
            share_type      amount;
         };

         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         /// first versions of the snapshot store objects touched by the current undo session
         struct snapshot_journal
         {
            std::vector<uint64_t>                          created;
            std::map<uint64_t, pending_withdrawals_object> old_withdrawals;
            std::map<uint64_t, fee_pool_object>            old_fee_pools;

            void clear()
            {
               created.clear();
               old_withdrawals.clear();
               old_fee_pools.clear();
            }
         };

         void revert_ledger_journal();
         void revert_snapshot_journal();

         asset_ledger&               _ledger;
         const attestation_verifier& _verifier;
         exchange_parameters         _params;
         account_id_type             _custodian;

         ledger_state                _state;
         snapshot_store              _snapshot_store;

         std::vector<ledger_journal_entry> _ledger_journal;
         snapshot_journal                  _snapshot_journal;
         bool                              _undo_enabled = false;

         std::vector< std::unique_ptr<op_evaluator> > _operation_evaluators;
   };

} } // ocex::chain
