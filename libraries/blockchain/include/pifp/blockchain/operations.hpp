#pragma once

#include <fc/io/enum_type.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>

namespace pifp { namespace blockchain {

struct transaction_evaluation_state;

// NOTE: values are part of the transaction wire format; never renumber
enum operation_type_enum
{
    null_op_type                        = 0,

    withdraw_op_type                    = 1,

    register_project_op_type            = 2,
    deposit_op_type                     = 3,
    submit_proof_op_type                = 4,
    attest_proof_op_type                = 5,
    release_op_type                     = 6,
    refund_op_type                      = 7,
    check_expiry_op_type                = 8,

    grant_role_op_type                  = 9,
    revoke_role_op_type                 = 10,
    transfer_super_admin_op_type        = 11
};

/**
*  A poly-morphic operator that modifies the ledger
*  in some manner.
*/
struct operation
{
    operation():type(null_op_type){}

    template<typename OperationType>
    operation( const OperationType& t )
    {
        type = OperationType::type;
        data = fc::raw::pack( t );
    }

    template<typename OperationType>
    OperationType as()const
    {
        FC_ASSERT( (operation_type_enum)type == OperationType::type, "", ("type",type)("OperationType",OperationType::type) );
        return fc::raw::unpack<OperationType>(data);
    }

    fc::enum_type<uint8_t,operation_type_enum> type;
    std::vector<char> data;
};

} } // pifp::blockchain

FC_REFLECT_ENUM( pifp::blockchain::operation_type_enum,
        (null_op_type)
        (withdraw_op_type)
        (register_project_op_type)
        (deposit_op_type)
        (submit_proof_op_type)
        (attest_proof_op_type)
        (release_op_type)
        (refund_op_type)
        (check_expiry_op_type)
        (grant_role_op_type)
        (revoke_role_op_type)
        (transfer_super_admin_op_type)
    )

FC_REFLECT( pifp::blockchain::operation, (type)(data) )

namespace fc
{
    void to_variant( const pifp::blockchain::operation& var, variant& vo );
    void from_variant( const variant& var, pifp::blockchain::operation& vo );
}
