#include <pifp/blockchain/commitment.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/io/raw.hpp>

namespace pifp { namespace blockchain {

   commitment_secret commitment_secret::generate( const address& owner )
   {
      commitment_secret secret;
      secret.nonce = fc::ecc::private_key::generate().get_secret();
      secret.owner = owner;
      return secret;
   }

   commitment_type commit( const commitment_secret& secret, const vector<char>& payload )
   {
      commitment_type::encoder enc;
      fc::raw::pack( enc, secret.nonce );
      fc::raw::pack( enc, secret.owner );
      fc::raw::pack( enc, payload );
      return enc.result();
   }

   bool verify( const commitment_type& commitment, const commitment_secret& secret, const vector<char>& payload )
   {
      return commit( secret, payload ) == commitment;
   }

   commitment_type commit_donation( const commitment_secret& secret, share_type amount )
   {
      return commit( secret, fc::raw::pack( amount ) );
   }

   bool verify_donation( const commitment_type& commitment, const commitment_secret& secret, share_type amount )
   {
      return verify( commitment, secret, fc::raw::pack( amount ) );
   }

   commitment_type commit_proof( const commitment_secret& secret, const vector<char>& proof_payload )
   {
      return commit( secret, proof_payload );
   }

   bool verify_proof( const commitment_type& commitment, const commitment_secret& secret, const vector<char>& proof_payload )
   {
      return verify( commitment, secret, proof_payload );
   }

} } // pifp::blockchain
