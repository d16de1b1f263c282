#pragma once

#include <pifp/blockchain/proof_record.hpp>

namespace pifp { namespace blockchain {

struct attestation_record;
typedef fc::optional<attestation_record> oattestation_record;

class chain_interface;

/**
 *  digest an oracle signs to attest a verdict; binds the chain, the proof submission,
 *  the proof commitment, the verdict and the signing time so a signature cannot be
 *  replayed for another proof or flipped to another verdict
 */
digest_type attestation_digest( const digest_type& chain_id,
                                const proof_index& proof,
                                const commitment_type& proof_commitment,
                                verdict_type verdict,
                                const time_point_sec timestamp );

/** immutable; at most one per proof submission */
struct attestation_record
{
    proof_index                                 proof;
    address                                     oracle;
    fc::enum_type<uint8_t,verdict_type>         verdict = pending_verdict;
    signature_type                              oracle_signature;
    /** time the oracle signed, covered by oracle_signature */
    time_point_sec                              signed_at;
    /** time the attestation was accepted by the ledger */
    time_point_sec                              recorded_at;

    void sanity_check( const chain_interface& )const;
    static oattestation_record lookup( const chain_interface&, const proof_index& );
    static void store( chain_interface&, const proof_index&, const attestation_record& );
    static void remove( chain_interface&, const proof_index& );
};

class attestation_db_interface
{
    friend struct attestation_record;

    virtual oattestation_record attestation_lookup_by_proof( const proof_index& )const = 0;
    virtual void attestation_insert_into_proof_map( const proof_index&, const attestation_record& ) = 0;
    virtual void attestation_erase_from_proof_map( const proof_index& ) = 0;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::attestation_record, (proof)(oracle)(verdict)(oracle_signature)(signed_at)(recorded_at) )
