#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/role_record.hpp>

namespace pifp { namespace blockchain {

bool role_record::can_register_projects()const
{
    switch( role_type( role ) )
    {
        case super_admin_role:
        case admin_role:
        case project_manager_role:
            return true;
        default:
            return false;
    }
}

bool role_record::can_administer()const
{
    return role == super_admin_role || role == admin_role;
}

void role_record::sanity_check( const chain_interface& db )const
{ try {
    FC_ASSERT( !holder.is_null() );
    FC_ASSERT( role != no_role );
    FC_ASSERT( role <= auditor_role );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

orole_record role_record::lookup( const chain_interface& db, const address& holder )
{ try {
    return db.role_lookup_by_holder( holder );
} FC_CAPTURE_AND_RETHROW( (holder) ) }

void role_record::store( chain_interface& db, const address& holder, const role_record& record )
{ try {
    db.role_insert_into_holder_map( holder, record );
} FC_CAPTURE_AND_RETHROW( (holder)(record) ) }

void role_record::remove( chain_interface& db, const address& holder )
{ try {
    const orole_record prev_record = db.lookup<role_record>( holder );
    if( prev_record.valid() )
        db.role_erase_from_holder_map( holder );
} FC_CAPTURE_AND_RETHROW( (holder) ) }

} } // pifp::blockchain
