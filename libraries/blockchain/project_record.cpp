#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/config.hpp>
#include <pifp/blockchain/project_record.hpp>

namespace pifp { namespace blockchain {

share_type project_record::locked_amount()const
{
    return funded_amount - released_amount - fee_amount - refunded_amount;
}

void project_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( id > 0 );
    FC_ASSERT( !creator.is_null() );
    FC_ASSERT( !implementer.is_null() );
    FC_ASSERT( target > 0 && target <= PIFP_BLOCKCHAIN_MAX_SHARES );
    FC_ASSERT( funded_amount >= 0 && funded_amount <= target );
    FC_ASSERT( locked_amount() >= 0 );
    FC_ASSERT( active_submission <= submission_count );
    FC_ASSERT( !settled || status == completed_status );
    FC_ASSERT( status != active_status || funded_amount >= target );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oproject_record project_record::lookup( const chain_interface& db, const project_id_type id )
{ try {
    return db.project_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void project_record::store( chain_interface& db, const project_id_type id, const project_record& record )
{ try {
    db.project_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

void project_record::remove( chain_interface& db, const project_id_type id )
{ try {
    const oproject_record prev_record = db.lookup<project_record>( id );
    if( prev_record.valid() )
        db.project_erase_from_id_map( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

} } // pifp::blockchain
