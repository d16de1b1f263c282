#define BOOST_TEST_MODULE CommitmentTests
#include <boost/test/unit_test.hpp>

#include <pifp/blockchain/attestation_record.hpp>
#include <pifp/blockchain/commitment.hpp>
#include <pifp/blockchain/oracle_operations.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/exception/exception.hpp>
#include <fc/io/raw.hpp>
#include <fc/log/logger.hpp>

using namespace pifp::blockchain;

namespace {
   private_key_type key_for( const std::string& name )
   {
      return fc::ecc::private_key::regenerate( fc::sha256::hash( name.c_str(), name.size() ) );
   }
}

BOOST_AUTO_TEST_CASE( donation_commitment_opens_with_its_secret )
{ try {
   const address donor( key_for( "donor" ).get_public_key() );
   const commitment_secret secret = commitment_secret::generate( donor );
   const commitment_type commitment = commit_donation( secret, 500 );

   BOOST_CHECK( verify_donation( commitment, secret, 500 ) );
   BOOST_CHECK( !verify_donation( commitment, secret, 501 ) );

   commitment_secret other_owner = secret;
   other_owner.owner = address( key_for( "someone else" ).get_public_key() );
   BOOST_CHECK( !verify_donation( commitment, other_owner, 500 ) );

   commitment_secret other_nonce = secret;
   other_nonce.nonce = fc::sha256::hash( std::string( "guess" ) );
   BOOST_CHECK( !verify_donation( commitment, other_nonce, 500 ) );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }

BOOST_AUTO_TEST_CASE( commitments_hide_identical_donations )
{
   const address donor( key_for( "donor" ).get_public_key() );
   const commitment_secret first = commitment_secret::generate( donor );
   const commitment_secret second = commitment_secret::generate( donor );

   BOOST_CHECK( first.nonce != second.nonce );
   BOOST_CHECK( commit_donation( first, 100 ) != commit_donation( second, 100 ) );
}

BOOST_AUTO_TEST_CASE( payload_boundaries_are_unambiguous )
{
   const commitment_secret secret = commitment_secret::generate( address( key_for( "implementer" ).get_public_key() ) );

   const vector<char> empty;
   const vector<char> one_zero( 1, '\0' );
   BOOST_CHECK( commit_proof( secret, empty ) != commit_proof( secret, one_zero ) );

   // a donation commitment commits to the packed amount
   const vector<char> packed_amount = fc::raw::pack( share_type( 42 ) );
   BOOST_CHECK( verify_proof( commit_donation( secret, 42 ), secret, packed_amount ) );
   BOOST_CHECK( !verify_proof( commit_donation( secret, 42 ), secret, vector<char>( packed_amount.begin(), packed_amount.end() - 1 ) ) );
}

BOOST_AUTO_TEST_CASE( attestation_signature_binds_every_field )
{ try {
   const private_key_type oracle_key = key_for( "oracle" );
   const address oracle( oracle_key.get_public_key() );
   const digest_type chain_id = fc::sha256::hash( std::string( "chain" ) );
   const commitment_type proof_commitment = fc::sha256::hash( std::string( "proof" ) );
   const proof_index proof( 7, 1 );

   const attest_proof_operation op = attest_proof_operation::sign( oracle_key, chain_id, proof, proof_commitment,
                                                                   verified_verdict, fc::time_point_sec( 1577836800 ) );
   BOOST_CHECK( op.signer( chain_id ) == oracle );

   attest_proof_operation flipped = op;
   flipped.verdict = rejected_verdict;
   BOOST_CHECK( flipped.signer( chain_id ) != oracle );

   attest_proof_operation replayed = op;
   replayed.proof = proof_index( 7, 2 );
   BOOST_CHECK( replayed.signer( chain_id ) != oracle );

   // a relayer cannot restamp the attestation
   attest_proof_operation restamped = op;
   restamped.timestamp = op.timestamp + 3600;
   BOOST_CHECK( restamped.signer( chain_id ) != oracle );

   BOOST_CHECK( op.signer( fc::sha256::hash( std::string( "other chain" ) ) ) != oracle );

   const fc::time_point_sec signed_at( 1577836800 );
   BOOST_CHECK( attestation_digest( chain_id, proof, proof_commitment, verified_verdict, signed_at )
                != attestation_digest( chain_id, proof, proof_commitment, rejected_verdict, signed_at ) );
} catch ( const fc::exception& e )
{
   elog( "${e}", ("e",e.to_detail_string() ) );
   throw;
} }
