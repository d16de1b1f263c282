#define BOOST_TEST_MODULE ReleaseTests
#include <boost/test/unit_test.hpp>
#include "chain_fixture.hpp"

struct release_fixture : public chain_fixture
{
   /** a funded project whose only proof submission has been verified */
   project_id_type completed_project( share_type target = 10000 )
   {
      const project_id_type project_id = funded_project( target );
      submit_proof( project_id, test_payload( "report" ) );
      attest( proof_index( project_id, 1 ), verified_verdict );
      return project_id;
   }

   /** a funded project that passed its deadline without a verified proof */
   project_id_type expired_project( share_type target = 10000 )
   {
      const project_id_type project_id = funded_project( target );
      advance_time( PIFP_TEST_PROJECT_DURATION + 1 );

      signed_transaction trx;
      trx.check_expiry( project_id );
      push( trx, {} );
      return project_id;
   }

   transaction_evaluation_state_ptr refund( project_id_type project_id,
                                            donation_id_type donation_id,
                                            const commitment_secret& secret,
                                            const private_key_type& key )
   {
      signed_transaction trx;
      trx.refund( project_id, donation_id, secret );
      return push( trx, { key } );
   }
};

BOOST_FIXTURE_TEST_SUITE( release_tests, release_fixture )

BOOST_AUTO_TEST_CASE( verification_releases_funds_less_fee )
{ try {
   const project_id_type project_id = completed_project( 10000 );

   const share_type fee = 10000 * PIFP_TEST_FEE_BPS / PIFP_BLOCKCHAIN_BASIS_POINTS;
   BOOST_CHECK_EQUAL( db->get_balance( manager ), 10000 - fee );
   BOOST_CHECK_EQUAL( db->get_balance( treasury ), fee );

   const project_record rec = project( project_id );
   BOOST_CHECK( rec.settled );
   BOOST_CHECK_EQUAL( rec.released_amount, 10000 - fee );
   BOOST_CHECK_EQUAL( rec.fee_amount, fee );
   BOOST_CHECK_EQUAL( rec.locked_amount(), 0 );

   for( const auto& donation : db->get_donations( project_id ) )
      BOOST_CHECK( donation.state == donation_released );

   const auto events = db->get_events( db->last_event_sequence() - 1 );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   BOOST_CHECK( events[0].type == funds_released_event );
   BOOST_CHECK_EQUAL( events[0].amount, 10000 - fee );
   BOOST_REQUIRE( events[0].account.valid() );
   BOOST_CHECK( *events[0].account == manager );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( release_pays_a_distinct_implementer )
{
   signed_transaction trx;
   trx.register_project( manager, bob, 1000, pifp::blockchain::now() + PIFP_TEST_PROJECT_DURATION, schema_hash );
   push( trx, { manager_key } );
   const project_id_type project_id = db->last_project_id();
   deposit( project_id, alice_key, 1000 );

   // only the implementer may submit the proof
   signed_transaction by_creator;
   by_creator.submit_proof( project_id, fc::sha256::hash( std::string( "report" ) ) );
   BOOST_CHECK_THROW( push( by_creator, { manager_key } ), missing_signature );

   signed_transaction by_implementer;
   by_implementer.submit_proof( project_id, fc::sha256::hash( std::string( "report" ) ) );
   push( by_implementer, { bob_key } );
   attest( proof_index( project_id, 1 ), verified_verdict );

   const share_type fee = 1000 * PIFP_TEST_FEE_BPS / PIFP_BLOCKCHAIN_BASIS_POINTS;
   BOOST_CHECK_EQUAL( db->get_balance( bob ), PIFP_TEST_INITIAL_BALANCE + 1000 - fee );
   BOOST_CHECK_EQUAL( db->get_balance( manager ), 0 );
}

BOOST_AUTO_TEST_CASE( release_is_idempotent )
{
   const project_id_type project_id = completed_project();
   const share_type implementer_balance = db->get_balance( manager );
   const share_type treasury_balance = db->get_balance( treasury );
   const uint64_t events_before = db->last_event_sequence();

   signed_transaction trx;
   trx.release( project_id );
   push( trx, { alice_key } );

   signed_transaction again;
   again.release( project_id );
   push( again, {} );

   BOOST_CHECK_EQUAL( db->get_balance( manager ), implementer_balance );
   BOOST_CHECK_EQUAL( db->get_balance( treasury ), treasury_balance );
   BOOST_CHECK_EQUAL( db->last_event_sequence(), events_before );
}

BOOST_AUTO_TEST_CASE( replayed_release_is_a_no_op )
{ try {
   const project_id_type project_id = completed_project();
   const project_id_type funding = register_project( 1000 );
   const share_type implementer_balance = db->get_balance( manager );
   const uint64_t events_before = db->last_event_sequence();

   signed_transaction trx;
   trx.expiration = pifp::blockchain::now() + 60;
   trx.release( project_id );
   db->push_transaction( trx );

   const auto replay = db->push_transaction( trx );
   BOOST_CHECK( replay->replayed );
   BOOST_CHECK( replay->events.empty() );

   // a replay that carries other operations is a plain duplicate
   signed_transaction mixed;
   mixed.expiration = pifp::blockchain::now() + 60;
   mixed.release( project_id );
   mixed.check_expiry( funding );
   db->push_transaction( mixed );
   BOOST_CHECK_THROW( db->push_transaction( mixed ), duplicate_transaction );

   BOOST_CHECK_EQUAL( db->get_balance( manager ), implementer_balance );
   BOOST_CHECK_EQUAL( db->last_event_sequence(), events_before );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( release_requires_a_completed_project )
{
   const project_id_type project_id = funded_project();

   signed_transaction active;
   active.release( project_id );
   BOOST_CHECK_THROW( push( active, {} ), invalid_state );

   submit_proof( project_id, test_payload( "report" ) );
   signed_transaction submitted;
   submitted.release( project_id );
   BOOST_CHECK_THROW( push( submitted, {} ), invalid_state );

   signed_transaction unknown;
   unknown.release( 77 );
   BOOST_CHECK_THROW( push( unknown, {} ), unknown_project );

   BOOST_CHECK_EQUAL( db->get_balance( manager ), 0 );
}

BOOST_AUTO_TEST_CASE( expired_project_refunds_each_donor )
{ try {
   const project_id_type project_id = expired_project( 10000 );
   const uint64_t events_before = db->last_event_sequence();

   refund( project_id, 1, alice_secret, alice_key );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PIFP_TEST_INITIAL_BALANCE );
   BOOST_CHECK_EQUAL( project( project_id ).locked_amount(), 4000 );

   refund( project_id, 2, bob_secret, bob_key );
   BOOST_CHECK_EQUAL( db->get_balance( bob ), PIFP_TEST_INITIAL_BALANCE );

   const project_record rec = project( project_id );
   BOOST_CHECK_EQUAL( rec.refunded_amount, 10000 );
   BOOST_CHECK_EQUAL( rec.locked_amount(), 0 );
   BOOST_CHECK( rec.status == expired_status );

   for( const auto& donation : db->get_donations( project_id ) )
      BOOST_CHECK( donation.state == donation_refunded );

   const auto events = db->get_events( events_before );
   BOOST_REQUIRE_EQUAL( events.size(), 2u );
   BOOST_CHECK( events[0].type == refunded_event );
   BOOST_CHECK_EQUAL( events[0].amount, 6000 );
   BOOST_REQUIRE( events[1].donation_id.valid() );
   BOOST_CHECK_EQUAL( *events[1].donation_id, 2u );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( donation_is_refunded_only_once )
{
   const project_id_type project_id = expired_project();
   refund( project_id, 1, alice_secret, alice_key );

   BOOST_CHECK_THROW( refund( project_id, 1, alice_secret, alice_key ), already_settled );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PIFP_TEST_INITIAL_BALANCE );
}

BOOST_AUTO_TEST_CASE( refund_requires_the_donor )
{
   const project_id_type project_id = expired_project();

   // bob cannot open alice's commitment with his own secret
   BOOST_CHECK_THROW( refund( project_id, 1, bob_secret, bob_key ), unauthorized );

   // knowing the secret is not enough, the donor address must sign
   BOOST_CHECK_THROW( refund( project_id, 1, alice_secret, bob_key ), missing_signature );

   // redirecting the refund breaks the commitment
   commitment_secret redirected = alice_secret;
   redirected.owner = bob;
   BOOST_CHECK_THROW( refund( project_id, 1, redirected, bob_key ), unauthorized );

   BOOST_CHECK_EQUAL( db->get_balance( bob ), PIFP_TEST_INITIAL_BALANCE - 4000 );
   BOOST_CHECK( db->get_donations( project_id )[0].state == donation_locked );
}

BOOST_AUTO_TEST_CASE( refund_requires_an_expired_project )
{
   const project_id_type active = funded_project();
   BOOST_CHECK_THROW( refund( active, 1, alice_secret, alice_key ), invalid_state );

   const project_id_type completed = completed_project();
   BOOST_CHECK_THROW( refund( completed, 1, alice_secret, alice_key ), invalid_state );

   // past the deadline but not yet marked expired
   const project_id_type lapsed = funded_project();
   advance_time( PIFP_TEST_PROJECT_DURATION + 1 );
   BOOST_CHECK_THROW( refund( lapsed, 1, alice_secret, alice_key ), invalid_state );

   BOOST_CHECK_THROW( refund( 99, 1, alice_secret, alice_key ), unknown_project );
}

BOOST_AUTO_TEST_CASE( refund_of_unknown_donation_is_rejected )
{
   const project_id_type project_id = expired_project();
   BOOST_CHECK_THROW( refund( project_id, 3, alice_secret, alice_key ), unknown_donation );
}

BOOST_AUTO_TEST_CASE( underfunded_project_refunds_after_expiry )
{
   const project_id_type project_id = register_project( 10000 );
   const commitment_secret secret = deposit( project_id, alice_key, 2500 );

   advance_time( PIFP_TEST_PROJECT_DURATION + 1 );

   // expiry and refund may share a transaction
   signed_transaction trx;
   trx.check_expiry( project_id );
   trx.refund( project_id, 1, secret );
   push( trx, { alice_key } );

   BOOST_CHECK_EQUAL( db->get_balance( alice ), PIFP_TEST_INITIAL_BALANCE );
   BOOST_CHECK( project( project_id ).status == expired_status );
}

BOOST_AUTO_TEST_CASE( funds_are_conserved )
{
   const project_id_type completed = completed_project( 20000 );
   const project_id_type expired = expired_project( 5000 );
   refund( expired, 1, alice_secret, alice_key );

   share_type total = 0;
   for( const address& owner : { alice, bob, manager, treasury } )
      total += db->get_balance( owner );
   for( const auto& rec : db->get_projects() )
      total += rec.locked_amount();

   BOOST_CHECK_EQUAL( total, 2 * PIFP_TEST_INITIAL_BALANCE );

   const project_record done = project( completed );
   BOOST_CHECK_EQUAL( done.released_amount + done.fee_amount, done.funded_amount );
}

BOOST_AUTO_TEST_SUITE_END()
