#include <pifp/blockchain/balance_record.hpp>
#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/config.hpp>

namespace pifp { namespace blockchain {

void balance_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( !owner.is_null() );
    FC_ASSERT( balance >= 0 && balance <= PIFP_BLOCKCHAIN_MAX_SHARES );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

obalance_record balance_record::lookup( const chain_interface& db, const balance_id_type& id )
{ try {
    return db.balance_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void balance_record::store( chain_interface& db, const balance_id_type& id, const balance_record& record )
{ try {
    db.balance_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

void balance_record::remove( chain_interface& db, const balance_id_type& id )
{ try {
    const obalance_record prev_record = db.lookup<balance_record>( id );
    if( prev_record.valid() )
        db.balance_erase_from_id_map( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

} } // pifp::blockchain
