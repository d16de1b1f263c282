#define BOOST_TEST_MODULE RoleTests
#include <boost/test/unit_test.hpp>
#include "chain_fixture.hpp"

struct role_fixture : public chain_fixture
{
   transaction_evaluation_state_ptr grant( const private_key_type& caller_key, const address& target, role_type role )
   {
      signed_transaction trx;
      trx.grant_role( address( caller_key.get_public_key() ), target, role );
      return push( trx, { caller_key } );
   }

   transaction_evaluation_state_ptr revoke( const private_key_type& caller_key, const address& target )
   {
      signed_transaction trx;
      trx.revoke_role( address( caller_key.get_public_key() ), target );
      return push( trx, { caller_key } );
   }
};

BOOST_FIXTURE_TEST_SUITE( rbac_tests, role_fixture )

BOOST_AUTO_TEST_CASE( super_admin_delegates_administration )
{ try {
   const uint64_t version = db->get_authority_version();

   grant( super_admin_key, alice, admin_role );
   BOOST_CHECK( db->get_role( alice ) == admin_role );
   BOOST_CHECK_EQUAL( db->get_authority_version(), version + 1 );

   const orole_record record = db->get_role_record( alice );
   BOOST_REQUIRE( record.valid() );
   BOOST_CHECK( record->granted_by == super_admin );
   BOOST_CHECK_EQUAL( record->authority_version, version + 1 );

   // the new admin manages the remaining roles
   grant( alice_key, bob, auditor_role );
   BOOST_CHECK( db->get_role( bob ) == auditor_role );

   grant( alice_key, bob, project_manager_role );
   BOOST_CHECK( db->get_role( bob ) == project_manager_role );

   const auto events = db->get_events( db->last_event_sequence() - 1 );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   BOOST_CHECK( events[0].type == role_granted_event );
   BOOST_REQUIRE( events[0].role.valid() );
   BOOST_CHECK( *events[0].role == project_manager_role );
   BOOST_REQUIRE( events[0].account.valid() );
   BOOST_CHECK( *events[0].account == bob );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( only_administrators_grant_roles )
{
   BOOST_CHECK_THROW( grant( alice_key, bob, auditor_role ), unauthorized );
   BOOST_CHECK_THROW( grant( manager_key, bob, project_manager_role ), unauthorized );
   BOOST_CHECK_THROW( grant( oracle_key, alice, oracle_role ), unauthorized );

   signed_transaction unsigned_grant;
   unsigned_grant.grant_role( super_admin, alice, admin_role );
   BOOST_CHECK_THROW( push( unsigned_grant, { alice_key } ), missing_signature );

   BOOST_CHECK( db->get_role( alice ) == no_role );
   BOOST_CHECK( db->get_role( bob ) == no_role );
}

BOOST_AUTO_TEST_CASE( super_admin_role_is_never_granted )
{
   BOOST_CHECK_THROW( grant( super_admin_key, alice, super_admin_role ), invalid_parameters );

   grant( super_admin_key, alice, admin_role );
   BOOST_CHECK_THROW( grant( alice_key, bob, super_admin_role ), unauthorized );
   BOOST_CHECK_THROW( grant( alice_key, super_admin, auditor_role ), unauthorized );
}

BOOST_AUTO_TEST_CASE( grant_validates_role_and_target )
{
   BOOST_CHECK_THROW( grant( super_admin_key, alice, no_role ), invalid_parameters );
   BOOST_CHECK_THROW( grant( super_admin_key, address(), admin_role ), invalid_parameters );
   BOOST_CHECK_THROW( grant( super_admin_key, alice, role_type( 42 ) ), invalid_parameters );
}

BOOST_AUTO_TEST_CASE( revoke_removes_the_role )
{
   const uint64_t version = db->get_authority_version();
   revoke( super_admin_key, manager );

   BOOST_CHECK( db->get_role( manager ) == no_role );
   BOOST_CHECK( !db->get_role_record( manager ).valid() );
   BOOST_CHECK_EQUAL( db->get_authority_version(), version + 1 );

   const auto events = db->get_events( db->last_event_sequence() - 1 );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   BOOST_CHECK( events[0].type == role_revoked_event );

   // a former manager cannot register projects
   signed_transaction trx;
   trx.register_project( manager, address(), 100, pifp::blockchain::now() + 3600, schema_hash );
   BOOST_CHECK_THROW( push( trx, { manager_key } ), unauthorized );

   // revoking an address without a role changes nothing
   const uint64_t sequence = db->last_event_sequence();
   revoke( super_admin_key, alice );
   BOOST_CHECK_EQUAL( db->last_event_sequence(), sequence );
   BOOST_CHECK_EQUAL( db->get_authority_version(), version + 1 );
}

BOOST_AUTO_TEST_CASE( revoked_grant_cannot_be_replayed )
{ try {
   const address candidate( test_key( "candidate oracle" ).get_public_key() );

   signed_transaction grant_trx;
   grant_trx.expiration = pifp::blockchain::now() + 60*60;
   grant_trx.grant_role( super_admin, candidate, oracle_role );
   grant_trx.sign( super_admin_key, db->get_chain_id() );
   db->push_transaction( grant_trx );
   BOOST_CHECK( db->get_role( candidate ) == oracle_role );

   revoke( super_admin_key, candidate );
   const uint64_t version = db->get_authority_version();

   BOOST_CHECK_THROW( db->push_transaction( grant_trx ), duplicate_transaction );

   signed_transaction resigned = grant_trx;
   resigned.signatures.push_back( grant_trx.signatures.front() );
   BOOST_CHECK_THROW( db->push_transaction( resigned ), duplicate_transaction );

   BOOST_CHECK( db->get_role( candidate ) == no_role );
   BOOST_CHECK_EQUAL( db->get_authority_version(), version );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( super_admin_cannot_be_revoked )
{
   grant( super_admin_key, alice, admin_role );
   BOOST_CHECK_THROW( revoke( alice_key, super_admin ), unauthorized );
   BOOST_CHECK_THROW( revoke( super_admin_key, super_admin ), unauthorized );
   BOOST_CHECK_THROW( revoke( bob_key, manager ), unauthorized );
   BOOST_CHECK( db->get_role( super_admin ) == super_admin_role );
}

BOOST_AUTO_TEST_CASE( oracle_set_follows_role_changes )
{
   const project_id_type project_id = funded_project();
   submit_proof( project_id, test_payload( "report" ) );
   const proof_index proof( project_id, 1 );
   const commitment_type commitment = db->get_proof_record( proof )->proof_commitment;

   revoke( super_admin_key, oracle );
   BOOST_CHECK_THROW( attest( proof, commitment, verified_verdict, oracle_key ), unauthorized_oracle );

   const private_key_type new_oracle_key = test_key( "new oracle" );
   grant( super_admin_key, address( new_oracle_key.get_public_key() ), oracle_role );
   attest( proof, commitment, verified_verdict, new_oracle_key );

   BOOST_CHECK( project( project_id ).status == completed_status );
   BOOST_CHECK( db->get_attestation( proof )->oracle == address( new_oracle_key.get_public_key() ) );
}

BOOST_AUTO_TEST_CASE( transfer_super_admin_hands_over_control )
{ try {
   signed_transaction trx;
   trx.transfer_super_admin( super_admin, alice );
   push( trx, { super_admin_key } );

   BOOST_REQUIRE( db->get_super_admin().valid() );
   BOOST_CHECK( *db->get_super_admin() == alice );
   BOOST_CHECK( db->get_role( alice ) == super_admin_role );
   BOOST_CHECK( db->get_role( super_admin ) == no_role );

   BOOST_CHECK_THROW( grant( super_admin_key, bob, admin_role ), unauthorized );
   grant( alice_key, bob, admin_role );
   BOOST_CHECK( db->get_role( bob ) == admin_role );

   // the transfer survives a restart
   reopen_chain();
   BOOST_CHECK( *db->get_super_admin() == alice );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( transfer_super_admin_is_restricted )
{
   grant( super_admin_key, alice, admin_role );

   signed_transaction by_admin;
   by_admin.transfer_super_admin( alice, bob );
   BOOST_CHECK_THROW( push( by_admin, { alice_key } ), unauthorized );

   signed_transaction unsigned_transfer;
   unsigned_transfer.transfer_super_admin( super_admin, bob );
   BOOST_CHECK_THROW( push( unsigned_transfer, { bob_key } ), missing_signature );

   signed_transaction to_self;
   to_self.transfer_super_admin( super_admin, super_admin );
   BOOST_CHECK_THROW( push( to_self, { super_admin_key } ), invalid_parameters );

   signed_transaction to_null;
   to_null.transfer_super_admin( super_admin, address() );
   BOOST_CHECK_THROW( push( to_null, { super_admin_key } ), invalid_parameters );

   BOOST_CHECK( *db->get_super_admin() == super_admin );
}

BOOST_AUTO_TEST_SUITE_END()
