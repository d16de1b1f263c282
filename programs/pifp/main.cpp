#include "config.hpp"

#include <boost/program_options.hpp>

#include <pifp/blockchain/chain_database.hpp>
#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/time.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>
#include <pifp/oracle/oracle_service.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <iostream>
#include <string>

using namespace pifp::blockchain;

boost::program_options::variables_map parse_option_variables(int argc, char** argv)
{
    boost::program_options::options_description option_config("Usage");
    option_config.add_options()
        ("help", "Display this help message and exit")

        ("data-dir", boost::program_options::value<string>()->default_value("pifp_data"), "Directory holding the ledger, oracle queue, config and logs")
        ("genesis", boost::program_options::value<string>(), "Genesis JSON used to initialize a new ledger")
        ("oracle-key", boost::program_options::value<string>(), "Hex encoded private key of an oracle; enables the oracle service")
        ("simulated-time", boost::program_options::value<string>(), "Run on a simulated clock starting at this ISO time, e.g. 20200101T000000")
        ;

    boost::program_options::variables_map option_variables;
    try
    {
        boost::program_options::store(
                                      boost::program_options::command_line_parser(argc, argv)
                                     .options(option_config)
                                     .run(),
                                     option_variables
                                     );
        boost::program_options::notify(option_variables);
    }
    catch (boost::program_options::error& cmdline_error)
    {
        std::cerr << "Error: " << cmdline_error.what() << "\n";
        std::cerr << option_config << "\n";
        exit(1);
    }

    if (option_variables.count("help"))
    {
        std::cout << option_config << "\n";
        std::cout << "Requests are read from stdin, one JSON object {\"method\":...,\"params\":...} per line.\n";
        std::cout << "Each committed event is written as {\"event\":...} before the reply of the request that caused it.\n";
        exit(0);
    }

    return option_variables;
}

/** writes every journaled event to stdout as it is committed */
class event_printer : public chain_observer
{
   public:
      virtual void transaction_applied( const transaction_record& record ) override {}

      virtual void event_emitted( const event_record& event ) override
      {
         std::cout << fc::json::to_string( fc::mutable_variant_object( "event", event ) ) << "\n";
      }
};

/**
 *  Executes one request line and returns the JSON reply.  Requests:
 *    push_transaction       params: signed_transaction
 *    submit_proof_request   params: proof_request
 *    process_oracle
 *    get_project            params: project id
 *    get_projects           params: [first, limit]
 *    get_donations          params: project id
 *    get_proofs             params: project id
 *    get_balance            params: address
 *    get_events             params: [after_sequence, limit]
 *    list_requests          params: status
 *    advance_time           params: seconds, simulated clock only
 */
fc::variant execute( const chain_database_ptr& chain, const pifp::oracle::oracle_service_ptr& oracle,
                     const string& method, const fc::variant& params )
{
    if( method == "push_transaction" )
    {
        const auto eval_state = chain->push_transaction( params.as<signed_transaction>() );
        return fc::mutable_variant_object( "id", eval_state->trx.id() )( "events", eval_state->events );
    }
    if( method == "get_project" )
        return fc::variant( chain->get_project( params.as_uint64() ) );
    if( method == "get_projects" )
    {
        const auto args = params.get_array();
        return fc::variant( chain->get_projects( args.at( 0 ).as_uint64(), args.at( 1 ).as<uint32_t>() ) );
    }
    if( method == "get_donations" )
        return fc::variant( chain->get_donations( params.as_uint64() ) );
    if( method == "get_proofs" )
        return fc::variant( chain->get_proofs( params.as_uint64() ) );
    if( method == "get_balance" )
        return fc::variant( chain->get_balance( params.as<address>() ) );
    if( method == "get_events" )
    {
        const auto args = params.get_array();
        return fc::variant( chain->get_events( args.at( 0 ).as_uint64(), args.at( 1 ).as<uint32_t>() ) );
    }
    if( method == "advance_time" )
    {
        FC_ASSERT( is_simulated_time(), "advance_time requires --simulated-time" );
        advance_time( params.as<int32_t>() );
        return fc::variant( now() );
    }

    FC_ASSERT( oracle, "${method} requires --oracle-key", ("method",method) );
    if( method == "submit_proof_request" )
        return fc::variant( oracle->store_request( params.as<pifp::oracle::proof_request>() ) );
    if( method == "process_oracle" )
        return fc::variant( oracle->process_pending() );
    if( method == "list_requests" )
        return fc::variant( oracle->list_requests( params.as<pifp::oracle::request_status_enum>() ) );

    FC_THROW( "unknown method ${method}", ("method",method) );
}

int main( int argc, char** argv )
{
   try
   {
      const auto option_variables = parse_option_variables( argc, argv );

      const fc::path data_dir = fc::absolute( fc::path( option_variables["data-dir"].as<string>() ) );
      pifp::node::config cfg = pifp::node::load_config( data_dir );
      fc::configure_logging( cfg.logging );

      if( option_variables.count( "simulated-time" ) )
         start_simulated_time( fc::time_point::from_iso_string( option_variables["simulated-time"].as<string>() ) );

      fc::optional<fc::path> genesis_file = cfg.genesis_config;
      if( option_variables.count( "genesis" ) )
         genesis_file = fc::path( option_variables["genesis"].as<string>() );

      chain_database_ptr chain = std::make_shared<chain_database>();
      chain->open( data_dir / "chain", genesis_file );
      ilog( "ledger ${id} open at ${dir}", ("id",chain->get_chain_id())("dir",data_dir) );

      event_printer printer;
      chain->add_observer( &printer );

      pifp::oracle::oracle_service_ptr oracle;
      if( option_variables.count( "oracle-key" ) )
      {
         const auto key = fc::ecc::private_key::regenerate( fc::sha256( option_variables["oracle-key"].as<string>() ) );
         oracle = std::make_shared<pifp::oracle::oracle_service>( key, chain,
                                                                 std::make_shared<pifp::oracle::chain_attestation_sink>( chain ) );
         oracle->open( data_dir / "oracle", cfg.oracle );
         if( !chain->has_role( oracle->oracle_address(), oracle_role ) )
            wlog( "${address} does not hold the oracle role; its attestations will be rejected",
                  ("address",oracle->oracle_address()) );
      }

      string line;
      while( std::getline( std::cin, line ) )
      {
         if( line.empty() ) continue;
         fc::mutable_variant_object reply;
         try
         {
            const auto request = fc::json::from_string( line ).get_object();
            const string method = request["method"].as_string();
            const fc::variant params = request.contains( "params" ) ? request["params"] : fc::variant();
            reply( "result", execute( chain, oracle, method, params ) );
         }
         catch( const fc::exception& e )
         {
            wlog( "request failed: ${e}", ("e",e.to_detail_string()) );
            reply( "error", fc::mutable_variant_object( "code", e.code() )( "name", e.name() )( "message", e.to_string() ) );
         }
         std::cout << fc::json::to_string( reply ) << "\n" << std::flush;
      }

      if( oracle ) oracle->close();
      chain->remove_observer( &printer );
      chain->close();
   }
   catch( const fc::exception& e )
   {
      std::cerr << "------------ error --------------\n"
                << e.to_detail_string() << "\n";
      wlog( "${e}", ("e", e.to_detail_string() ) );
      return 1;
   }
   return 0;
}
