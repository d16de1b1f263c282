#pragma once

#include <pifp/blockchain/chain_database.hpp>
#include <pifp/blockchain/commitment.hpp>
#include <pifp/blockchain/config.hpp>
#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/genesis_state.hpp>
#include <pifp/blockchain/oracle_operations.hpp>
#include <pifp/blockchain/time.hpp>
#include <pifp/blockchain/transaction.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <string>
#include <vector>

#define PIFP_TEST_INITIAL_BALANCE    1000000
#define PIFP_TEST_FEE_BPS            250
#define PIFP_TEST_PROJECT_DURATION   (60*60*24*7)
#define PIFP_TEST_SCHEMA_DOCUMENT    "well-depth-report-v1"

using namespace pifp::blockchain;

inline private_key_type test_key( const std::string& name )
{
   return fc::ecc::private_key::regenerate( fc::sha256::hash( name.c_str(), name.size() ) );
}

inline vector<char> test_payload( const std::string& text )
{
   return vector<char>( text.begin(), text.end() );
}

struct chain_fixture
{
   chain_fixture()
   :super_admin_key( test_key( "super_admin" ) ),
    oracle_key( test_key( "oracle" ) ),
    manager_key( test_key( "manager" ) ),
    alice_key( test_key( "alice" ) ),
    bob_key( test_key( "bob" ) ),
    treasury_key( test_key( "treasury" ) ),
    super_admin( super_admin_key.get_public_key() ),
    oracle( oracle_key.get_public_key() ),
    manager( manager_key.get_public_key() ),
    alice( alice_key.get_public_key() ),
    bob( bob_key.get_public_key() ),
    treasury( treasury_key.get_public_key() ),
    schema_hash( fc::sha256::hash( std::string( PIFP_TEST_SCHEMA_DOCUMENT ) ) )
   { try {
      disable_logging();
      start_simulated_time( fc::time_point::from_iso_string( "20200101T000000" ) );

      genesis.timestamp = pifp::blockchain::now();
      genesis.super_admin = super_admin;
      genesis.oracles.push_back( oracle );

      for( const address& owner : { alice, bob } )
      {
         genesis_balance balance;
         balance.owner = owner;
         balance.balance = PIFP_TEST_INITIAL_BALANCE;
         genesis.initial_balances.push_back( balance );
      }

      genesis.protocol_fee_bps = PIFP_TEST_FEE_BPS;
      genesis.fee_collector = treasury;

      open_chain();

      signed_transaction trx;
      trx.grant_role( super_admin, manager, project_manager_role );
      push( trx, { super_admin_key } );
   } FC_LOG_AND_RETHROW() }

   ~chain_fixture()
   {
      db.reset();
      stop_simulated_time();
   }

   void open_chain()
   {
      db = std::make_shared<chain_database>();
      db->open( dir.path() / "chain", genesis );
   }

   void reopen_chain()
   {
      db->close();
      db.reset();
      open_chain();
   }

   /** stamps an expiration and a fresh nonce, signs with keys and commits */
   transaction_evaluation_state_ptr push( signed_transaction trx, const vector<private_key_type>& keys )
   {
      trx.expiration = pifp::blockchain::now() + 60*60;
      trx.nonce = ++_nonce;
      for( const auto& key : keys )
         trx.sign( key, db->get_chain_id() );
      return db->push_transaction( trx );
   }

   project_id_type register_project( share_type target, uint32_t duration_sec = PIFP_TEST_PROJECT_DURATION )
   {
      signed_transaction trx;
      trx.register_project( manager, address(), target, pifp::blockchain::now() + duration_sec, schema_hash );
      push( trx, { manager_key } );
      return db->last_project_id();
   }

   /** returns the secret the donor needs to claim a refund later */
   commitment_secret deposit( project_id_type project_id, const private_key_type& donor_key, share_type amount )
   {
      const address donor( donor_key.get_public_key() );
      const commitment_secret secret = commitment_secret::generate( donor );

      signed_transaction trx;
      trx.deposit( project_id, amount, commit_donation( secret, amount ), donor );
      push( trx, { donor_key } );
      return secret;
   }

   /** registers a project and funds it to its target; alice gives 60%, bob the rest */
   project_id_type funded_project( share_type target = 10000 )
   {
      const project_id_type project_id = register_project( target );
      alice_secret = deposit( project_id, alice_key, target * 6 / 10 );
      bob_secret = deposit( project_id, bob_key, target - target * 6 / 10 );
      return project_id;
   }

   /** commits to payload as the implementer and returns the opening of the commitment */
   commitment_secret submit_proof( project_id_type project_id, const vector<char>& payload )
   {
      const commitment_secret secret = commitment_secret::generate( manager );

      signed_transaction trx;
      trx.submit_proof( project_id, commit_proof( secret, payload ) );
      push( trx, { manager_key } );
      return secret;
   }

   /** relayed without any transaction signature, the oracle signature alone authorizes it */
   transaction_evaluation_state_ptr attest( const proof_index& proof,
                                            const commitment_type& proof_commitment,
                                            verdict_type verdict,
                                            const private_key_type& key )
   {
      signed_transaction trx;
      trx.operations.emplace_back( attest_proof_operation::sign( key, db->get_chain_id(), proof,
                                                                 proof_commitment, verdict,
                                                                 pifp::blockchain::now() ) );
      return push( trx, {} );
   }

   transaction_evaluation_state_ptr attest( const proof_index& proof, verdict_type verdict )
   {
      const oproof_record record = db->get_proof_record( proof );
      FC_ASSERT( record.valid() );
      return attest( proof, record->proof_commitment, verdict, oracle_key );
   }

   project_record project( project_id_type project_id )const
   {
      const oproject_record record = db->get_project( project_id );
      FC_ASSERT( record.valid(), "unknown project ${id}", ("id",project_id) );
      return *record;
   }

   void enable_logging()
   {
      fc::configure_logging( fc::logging_config::default_config() );
   }

   void disable_logging()
   {
      fc::logging_config cfg;
      fc::configure_logging( cfg );
   }

   fc::temp_directory      dir;
   chain_database_ptr      db;
   genesis_state           genesis;

   private_key_type        super_admin_key;
   private_key_type        oracle_key;
   private_key_type        manager_key;
   private_key_type        alice_key;
   private_key_type        bob_key;
   private_key_type        treasury_key;

   address                 super_admin;
   address                 oracle;
   address                 manager;
   address                 alice;
   address                 bob;
   address                 treasury;

   digest_type             schema_hash;

   commitment_secret       alice_secret;
   commitment_secret       bob_secret;

   private:
      uint64_t             _nonce = 0;
};
