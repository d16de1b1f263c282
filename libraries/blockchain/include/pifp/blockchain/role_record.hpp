#pragma once

#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

enum role_type
{
    no_role             = 0,
    super_admin_role    = 1,
    admin_role          = 2,
    oracle_role         = 3,
    project_manager_role = 4,
    auditor_role        = 5
};

struct role_record;
typedef fc::optional<role_record> orole_record;

class chain_interface;

/**
 *  Each address holds at most one role.  The set of addresses holding
 *  oracle_role is the authorized oracle set consulted by attestations;
 *  it only changes through the role operations, each of which bumps the
 *  authority_version property.
 */
struct role_record
{
    address                                 holder;
    fc::enum_type<uint8_t,role_type>        role = no_role;
    address                                 granted_by;
    time_point_sec                          granted_at;
    uint64_t                                authority_version = 0;

    bool can_register_projects()const;
    bool can_administer()const;

    void sanity_check( const chain_interface& )const;
    static orole_record lookup( const chain_interface&, const address& );
    static void store( chain_interface&, const address&, const role_record& );
    static void remove( chain_interface&, const address& );
};

class role_db_interface
{
    friend struct role_record;

    virtual orole_record role_lookup_by_holder( const address& )const = 0;
    virtual void role_insert_into_holder_map( const address&, const role_record& ) = 0;
    virtual void role_erase_from_holder_map( const address& ) = 0;
};

} } // pifp::blockchain

FC_REFLECT_ENUM( pifp::blockchain::role_type,
        (no_role)
        (super_admin_role)
        (admin_role)
        (oracle_role)
        (project_manager_role)
        (auditor_role)
        )
FC_REFLECT( pifp::blockchain::role_record, (holder)(role)(granted_by)(granted_at)(authority_version) )
