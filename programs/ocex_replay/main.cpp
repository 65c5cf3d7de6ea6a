#include <ocex/chain/database.hpp>
#include <ocex/chain/exceptions.hpp>
#include <ocex/chain/memory_asset_ledger.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/program_options.hpp>

#include <iostream>

namespace bpo = boost::program_options;

using namespace ocex::chain;

namespace ocex { namespace replay {

   struct genesis_balance
   {
      account_id_type owner;
      asset_id_type   asset;
      share_type      amount;
   };

   /** everything needed to replay a sequence of blocks against a fresh ledger */
   struct replay_input
   {
      exchange_parameters                   parameters;
      std::vector<asset_id_type>            tokens;
      std::vector<genesis_balance>          balances;
      std::vector< std::vector<signed_call> > blocks;
   };

} } // ocex::replay

FC_REFLECT( ocex::replay::genesis_balance, (owner)(asset)(amount) )
FC_REFLECT( ocex::replay::replay_input, (parameters)(tokens)(balances)(blocks) )

namespace {

void print_block_output( uint32_t block_num, const database& db, bool print_events )
{
   for( const ingress_message& msg : db.get_ingress_messages() )
      std::cout << block_num << " ingress " << fc::json::to_string( msg ) << "\n";
   if( !print_events )
      return;
   for( const exchange_event& event : db.get_events() )
      std::cout << block_num << " event " << fc::json::to_string( event ) << "\n";
   for( const on_chain_event& record : db.get_on_chain_events() )
      std::cout << block_num << " on_chain " << fc::json::to_string( record ) << "\n";
}

}

int main( int argc, char** argv )
{
   try {
      bpo::options_description cli( "Usage: ocex_replay --input <file> [options]" );
      cli.add_options()
            ("help,h", "Print this help message and exit.")
            ("input,i", bpo::value<std::string>(), "JSON file with parameters, tokens, genesis balances and blocks")
            ("events,e", bpo::bool_switch()->default_value(false), "Also print chain events and on-chain records")
            ("continue-on-error", bpo::bool_switch()->default_value(false), "Report a rejected call and keep replaying")
            ("start-time", bpo::value<uint32_t>()->default_value(1700000000), "Timestamp of the first block")
            ("block-interval", bpo::value<uint32_t>()->default_value(6), "Seconds between blocks");

      bpo::variables_map options;
      bpo::store( bpo::parse_command_line( argc, argv, cli ), options );
      bpo::notify( options );

      if( options.count( "help" ) || !options.count( "input" ) )
      {
         std::cout << cli << "\n";
         return options.count( "help" ) ? 0 : 1;
      }

      const fc::path input_file( options["input"].as<std::string>() );
      FC_ASSERT( fc::exists( input_file ), "Input file ${f} does not exist", ("f", input_file) );
      const auto input = fc::json::from_file( input_file ).as<ocex::replay::replay_input>( OCEX_MAX_NESTED_OBJECTS );

      memory_asset_ledger ledger;
      signed_report_verifier verifier( input.parameters.attestation );
      database db( ledger, verifier, input.parameters );

      for( const asset_id_type& token : input.tokens )
         ledger.create_asset( token, db.get_custodian_account() );
      for( const auto& balance : input.balances )
         ledger.set_balance( balance.asset, balance.owner, balance.amount );

      const bool print_events = options["events"].as<bool>();
      const bool continue_on_error = options["continue-on-error"].as<bool>();
      const uint32_t interval = options["block-interval"].as<uint32_t>();
      fc::time_point_sec block_time( options["start-time"].as<uint32_t>() );

      uint32_t block_num = 0;
      uint32_t rejected = 0;
      for( const auto& block : input.blocks )
      {
         db.on_initialize( ++block_num, block_time );
         block_time += interval;

         for( const signed_call& call : block )
         {
            try {
               db.apply_call( call );
            } catch( const fc::exception& e ) {
               if( !continue_on_error )
                  throw;
               ++rejected;
               wlog( "Block ${b}: rejected ${c}: ${e}", ("b", block_num)("c", call)("e", e.to_string()) );
            }
         }

         print_block_output( block_num, db, print_events );
      }

      std::cout << "blocks " << block_num << " rejected " << rejected
                << " snapshot_nonce " << db.get_snapshot_nonce()
                << " operational " << ( db.is_exchange_operational() ? "true" : "false" ) << "\n";
      if( !db.get_state().accounts.empty() )
         std::cout << "accounts_mmr_root " << db.calculate_accounts_mmr_root().str() << "\n";

      return 0;
   } catch( const fc::exception& e ) {
      elog( "Exiting with error:\n${e}", ("e", e.to_detail_string()) );
   } catch( const std::exception& e ) {
      elog( "Exiting with error: ${e}", ("e", e.what()) );
   }
   return 1;
}
