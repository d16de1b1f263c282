#pragma once

#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/role_record.hpp>

namespace pifp { namespace blockchain {

/**
 *  The super admin may grant any role but super admin; admins may grant every
 *  role except super admin.  A grant replaces the target's current role.
 */
struct grant_role_operation
{
    static const operation_type_enum type;

    address                                 caller;
    address                                 target;
    fc::enum_type<uint8_t,role_type>        role = no_role;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/** super admin and admins only; the super admin cannot be revoked */
struct revoke_role_operation
{
    static const operation_type_enum type;

    address                                 caller;
    address                                 target;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

struct transfer_super_admin_operation
{
    static const operation_type_enum type;

    address                                 current_admin;
    address                                 new_admin;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::grant_role_operation, (caller)(target)(role) )
FC_REFLECT( pifp::blockchain::revoke_role_operation, (caller)(target) )
FC_REFLECT( pifp::blockchain::transfer_super_admin_operation, (current_admin)(new_admin) )
