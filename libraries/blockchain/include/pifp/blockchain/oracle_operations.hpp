#pragma once

#include <pifp/blockchain/attestation_record.hpp>
#include <pifp/blockchain/operations.hpp>

namespace pifp { namespace blockchain {

/**
 *  Carries an oracle's signed verdict on a proof submission.  Authority comes
 *  from oracle_signature alone, so any party may relay the transaction.
 */
struct attest_proof_operation
{
    static const operation_type_enum type;

    /** signs attestation_digest( chain_id, proof, proof_commitment, verdict, timestamp ) */
    static attest_proof_operation sign( const private_key_type& oracle_key,
                                        const digest_type& chain_id,
                                        const proof_index& proof,
                                        const commitment_type& proof_commitment,
                                        verdict_type verdict,
                                        const time_point_sec timestamp );

    /** recovers the address of the signing oracle */
    address signer( const digest_type& chain_id )const;

    proof_index                                 proof;
    commitment_type                             proof_commitment;
    fc::enum_type<uint8_t,verdict_type>         verdict = pending_verdict;
    time_point_sec                              timestamp;
    signature_type                              oracle_signature;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::attest_proof_operation, (proof)(proof_commitment)(verdict)(timestamp)(oracle_signature) )
