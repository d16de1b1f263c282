#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/donation_record.hpp>

namespace pifp { namespace blockchain {

void donation_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( index.project_id > 0 && index.donation_id > 0 );
    FC_ASSERT( amount > 0 );
    const oproject_record project = db.lookup<project_record>( index.project_id );
    FC_ASSERT( project.valid() );
    FC_ASSERT( index.donation_id <= project->donation_count );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

odonation_record donation_record::lookup( const chain_interface& db, const donation_index& index )
{ try {
    return db.donation_lookup_by_index( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

void donation_record::store( chain_interface& db, const donation_index& index, const donation_record& record )
{ try {
    db.donation_insert_into_index_map( index, record );
} FC_CAPTURE_AND_RETHROW( (index)(record) ) }

void donation_record::remove( chain_interface& db, const donation_index& index )
{ try {
    const odonation_record prev_record = db.lookup<donation_record>( index );
    if( prev_record.valid() )
        db.donation_erase_from_index_map( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

} } // pifp::blockchain
