#define BOOST_TEST_MODULE RegistryTests
#include <boost/test/unit_test.hpp>
#include "chain_fixture.hpp"

BOOST_FIXTURE_TEST_SUITE( registry_tests, chain_fixture )

BOOST_AUTO_TEST_CASE( register_project_starts_funding )
{ try {
   const time_point_sec deadline = pifp::blockchain::now() + PIFP_TEST_PROJECT_DURATION;
   const uint64_t events_before = db->last_event_sequence();

   signed_transaction trx;
   trx.register_project( manager, alice, 5000, deadline, schema_hash );
   push( trx, { manager_key } );

   const project_id_type project_id = db->last_project_id();
   BOOST_CHECK_EQUAL( project_id, 1u );

   const project_record rec = project( project_id );
   BOOST_CHECK( rec.creator == manager );
   BOOST_CHECK( rec.implementer == alice );
   BOOST_CHECK_EQUAL( rec.target, 5000 );
   BOOST_CHECK_EQUAL( rec.funded_amount, 0 );
   BOOST_CHECK( rec.deadline == deadline );
   BOOST_CHECK( rec.proof_schema_hash == schema_hash );
   BOOST_CHECK( rec.status == funding_status );

   const auto events = db->get_events( events_before );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   BOOST_CHECK( events[0].type == project_registered_event );
   BOOST_CHECK_EQUAL( events[0].project_id, project_id );
   BOOST_CHECK_EQUAL( events[0].amount, 5000 );
   BOOST_REQUIRE( events[0].account.valid() );
   BOOST_CHECK( *events[0].account == manager );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( project_ids_are_sequential )
{
   BOOST_CHECK_EQUAL( register_project( 100 ), 1u );
   BOOST_CHECK_EQUAL( register_project( 200 ), 2u );
   BOOST_CHECK_EQUAL( db->get_projects().size(), 2u );
   BOOST_CHECK_EQUAL( db->get_projects( 2 ).size(), 1u );
   BOOST_CHECK_EQUAL( db->get_projects( 1, 1 ).size(), 1u );
}

BOOST_AUTO_TEST_CASE( implementer_defaults_to_creator )
{
   const project_record rec = project( register_project( 100 ) );
   BOOST_CHECK( rec.implementer == manager );
}

BOOST_AUTO_TEST_CASE( register_project_requires_a_privileged_role )
{
   signed_transaction trx;
   trx.register_project( alice, address(), 100, pifp::blockchain::now() + 3600, schema_hash );
   BOOST_CHECK_THROW( push( trx, { alice_key } ), unauthorized );

   // the oracle role does not include project registration
   signed_transaction oracle_trx;
   oracle_trx.register_project( oracle, address(), 100, pifp::blockchain::now() + 3600, schema_hash );
   BOOST_CHECK_THROW( push( oracle_trx, { oracle_key } ), unauthorized );

   BOOST_CHECK( db->get_projects().empty() );
}

BOOST_AUTO_TEST_CASE( register_project_requires_the_creator_signature )
{
   signed_transaction trx;
   trx.register_project( manager, address(), 100, pifp::blockchain::now() + 3600, schema_hash );
   BOOST_CHECK_THROW( push( trx, { alice_key } ), missing_signature );
}

BOOST_AUTO_TEST_CASE( register_project_validates_parameters )
{
   const time_point_sec now = pifp::blockchain::now();

   signed_transaction zero_target;
   zero_target.register_project( manager, address(), 0, now + 3600, schema_hash );
   BOOST_CHECK_THROW( push( zero_target, { manager_key } ), invalid_parameters );

   signed_transaction negative_target;
   negative_target.register_project( manager, address(), -5, now + 3600, schema_hash );
   BOOST_CHECK_THROW( push( negative_target, { manager_key } ), invalid_parameters );

   signed_transaction past_deadline;
   past_deadline.register_project( manager, address(), 100, now, schema_hash );
   BOOST_CHECK_THROW( push( past_deadline, { manager_key } ), invalid_parameters );

   signed_transaction distant_deadline;
   distant_deadline.register_project( manager, address(), 100,
                                      now + PIFP_BLOCKCHAIN_MAX_PROJECT_DURATION_SEC + 1, schema_hash );
   BOOST_CHECK_THROW( push( distant_deadline, { manager_key } ), invalid_parameters );

   BOOST_CHECK_EQUAL( db->last_project_id(), 0u );
}

BOOST_AUTO_TEST_CASE( check_expiry_before_deadline_changes_nothing )
{
   const project_id_type project_id = register_project( 100 );
   const uint64_t events_before = db->last_event_sequence();

   signed_transaction trx;
   trx.check_expiry( project_id );
   push( trx, {} );

   BOOST_CHECK( project( project_id ).status == funding_status );
   BOOST_CHECK( db->get_events( events_before ).empty() );
}

BOOST_AUTO_TEST_CASE( check_expiry_after_deadline_expires_project )
{ try {
   const project_id_type project_id = register_project( 10000 );
   deposit( project_id, alice_key, 4000 );

   advance_time( PIFP_TEST_PROJECT_DURATION + 1 );
   const uint64_t events_before = db->last_event_sequence();

   signed_transaction trx;
   trx.check_expiry( project_id );
   push( trx, { bob_key } );

   const project_record rec = project( project_id );
   BOOST_CHECK( rec.status == expired_status );
   BOOST_CHECK_EQUAL( rec.funded_amount, 4000 );

   const auto events = db->get_events( events_before );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   BOOST_CHECK( events[0].type == project_expired_event );

   // a second check is a no-op
   signed_transaction again;
   again.check_expiry( project_id );
   push( again, {} );
   BOOST_CHECK_EQUAL( db->last_event_sequence(), events_before + 1 );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( check_expiry_expires_active_and_submitted_projects )
{
   const project_id_type active = funded_project();
   const project_id_type submitted = funded_project();
   submit_proof( submitted, test_payload( "report" ) );

   BOOST_CHECK( project( active ).status == active_status );
   BOOST_CHECK( project( submitted ).status == proof_submitted_status );

   advance_time( PIFP_TEST_PROJECT_DURATION + 1 );

   signed_transaction trx;
   trx.check_expiry( active );
   trx.check_expiry( submitted );
   push( trx, {} );

   BOOST_CHECK( project( active ).status == expired_status );
   BOOST_CHECK( project( submitted ).status == expired_status );
   BOOST_CHECK_EQUAL( project( submitted ).active_submission, 0u );
}

BOOST_AUTO_TEST_CASE( check_expiry_rejects_completed_and_unknown_projects )
{
   const project_id_type project_id = funded_project();
   submit_proof( project_id, test_payload( "report" ) );
   attest( proof_index( project_id, 1 ), verified_verdict );
   BOOST_REQUIRE( project( project_id ).status == completed_status );

   advance_time( PIFP_TEST_PROJECT_DURATION + 1 );

   signed_transaction completed;
   completed.check_expiry( project_id );
   BOOST_CHECK_THROW( push( completed, {} ), invalid_state );

   signed_transaction unknown;
   unknown.check_expiry( 42 );
   BOOST_CHECK_THROW( push( unknown, {} ), unknown_project );
}

BOOST_AUTO_TEST_CASE( submit_proof_requires_active_project )
{
   const project_id_type project_id = register_project( 10000 );

   signed_transaction trx;
   trx.submit_proof( project_id, fc::sha256::hash( std::string( "early" ) ) );
   BOOST_CHECK_THROW( push( trx, { manager_key } ), invalid_state );

   deposit( project_id, alice_key, 10000 );
   submit_proof( project_id, test_payload( "report" ) );

   // a second submission waits for the attestation of the first
   signed_transaction second;
   second.submit_proof( project_id, fc::sha256::hash( std::string( "second" ) ) );
   BOOST_CHECK_THROW( push( second, { manager_key } ), invalid_state );
}

BOOST_AUTO_TEST_CASE( submit_proof_requires_the_implementer )
{
   const project_id_type project_id = funded_project();

   signed_transaction trx;
   trx.submit_proof( project_id, fc::sha256::hash( std::string( "forged" ) ) );
   BOOST_CHECK_THROW( push( trx, { alice_key } ), missing_signature );
   BOOST_CHECK( project( project_id ).status == active_status );
}

BOOST_AUTO_TEST_CASE( submit_proof_after_deadline_is_rejected )
{
   const project_id_type project_id = funded_project();
   advance_time( PIFP_TEST_PROJECT_DURATION + 1 );

   signed_transaction trx;
   trx.submit_proof( project_id, fc::sha256::hash( std::string( "late" ) ) );
   BOOST_CHECK_THROW( push( trx, { manager_key } ), invalid_state );
}

BOOST_AUTO_TEST_CASE( submit_proof_records_the_commitment )
{
   const project_id_type project_id = funded_project();
   const vector<char> payload = test_payload( "report" );
   const commitment_secret secret = submit_proof( project_id, payload );

   const project_record rec = project( project_id );
   BOOST_CHECK( rec.status == proof_submitted_status );
   BOOST_CHECK_EQUAL( rec.submission_count, 1u );
   BOOST_CHECK_EQUAL( rec.active_submission, 1u );

   const auto proofs = db->get_proofs( project_id );
   BOOST_REQUIRE_EQUAL( proofs.size(), 1u );
   BOOST_CHECK( proofs[0].is_pending() );
   BOOST_CHECK( proofs[0].submitter == manager );
   BOOST_CHECK( verify_proof( proofs[0].proof_commitment, secret, payload ) );
}

BOOST_AUTO_TEST_SUITE_END()
