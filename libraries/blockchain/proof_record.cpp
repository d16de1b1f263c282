#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/proof_record.hpp>

namespace pifp { namespace blockchain {

void proof_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( index.project_id > 0 && index.submission > 0 );
    FC_ASSERT( !submitter.is_null() );
    FC_ASSERT( result <= rejected_verdict );
    const oproject_record project = db.lookup<project_record>( index.project_id );
    FC_ASSERT( project.valid() );
    FC_ASSERT( index.submission <= project->submission_count );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oproof_record proof_record::lookup( const chain_interface& db, const proof_index& index )
{ try {
    return db.proof_lookup_by_index( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

void proof_record::store( chain_interface& db, const proof_index& index, const proof_record& record )
{ try {
    db.proof_insert_into_index_map( index, record );
} FC_CAPTURE_AND_RETHROW( (index)(record) ) }

void proof_record::remove( chain_interface& db, const proof_index& index )
{ try {
    const oproof_record prev_record = db.lookup<proof_record>( index );
    if( prev_record.valid() )
        db.proof_erase_from_index_map( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

} } // pifp::blockchain
