#pragma once

#include <pifp/blockchain/types.hpp>

#include <fc/reflect/reflect.hpp>

namespace pifp { namespace blockchain {

   /**
    *  The secret half of a commitment.  It is kept off-chain by the party that
    *  produced the commitment and revealed only when the commitment must be
    *  opened, e.g. to claim a refund or to let the oracle check a proof payload.
    *
    *  The nonce makes the commitment hiding: without it nothing about the owner
    *  or the payload can be recovered from the hash, not even by enumerating
    *  plausible amounts.
    */
   struct commitment_secret
   {
      static commitment_secret generate( const address& owner );

      fc::sha256     nonce;
      address        owner;
   };

   /**
    *  commitment = sha256( nonce || owner || payload )
    *
    *  Every field is serialized with fc::raw so the payload carries its own
    *  length prefix and distinct (secret, payload) pairs never share an encoding.
    */
   commitment_type commit( const commitment_secret& secret, const vector<char>& payload );
   bool            verify( const commitment_type& commitment, const commitment_secret& secret, const vector<char>& payload );

   commitment_type commit_donation( const commitment_secret& secret, share_type amount );
   bool            verify_donation( const commitment_type& commitment, const commitment_secret& secret, share_type amount );

   commitment_type commit_proof( const commitment_secret& secret, const vector<char>& proof_payload );
   bool            verify_proof( const commitment_type& commitment, const commitment_secret& secret, const vector<char>& proof_payload );

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::commitment_secret, (nonce)(owner) )
