#include <pifp/blockchain/attestation_record.hpp>
#include <pifp/blockchain/chain_interface.hpp>

#include <fc/io/raw.hpp>

namespace pifp { namespace blockchain {

digest_type attestation_digest( const digest_type& chain_id,
                                const proof_index& proof,
                                const commitment_type& proof_commitment,
                                verdict_type verdict,
                                const time_point_sec timestamp )
{
   digest_type::encoder enc;
   fc::raw::pack( enc, chain_id );
   fc::raw::pack( enc, proof );
   fc::raw::pack( enc, proof_commitment );
   fc::raw::pack( enc, uint8_t( verdict ) );
   fc::raw::pack( enc, timestamp );
   return enc.result();
}

void attestation_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( verdict == verified_verdict || verdict == rejected_verdict );
    FC_ASSERT( !oracle.is_null() );
    FC_ASSERT( db.lookup<proof_record>( proof ).valid() );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oattestation_record attestation_record::lookup( const chain_interface& db, const proof_index& proof )
{ try {
    return db.attestation_lookup_by_proof( proof );
} FC_CAPTURE_AND_RETHROW( (proof) ) }

void attestation_record::store( chain_interface& db, const proof_index& proof, const attestation_record& record )
{ try {
    db.attestation_insert_into_proof_map( proof, record );
} FC_CAPTURE_AND_RETHROW( (proof)(record) ) }

void attestation_record::remove( chain_interface& db, const proof_index& proof )
{ try {
    const oattestation_record prev_record = db.lookup<attestation_record>( proof );
    if( prev_record.valid() )
        db.attestation_erase_from_proof_map( proof );
} FC_CAPTURE_AND_RETHROW( (proof) ) }

} } // pifp::blockchain
