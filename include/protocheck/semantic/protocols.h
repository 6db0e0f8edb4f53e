#pragma once

#include "protocheck/diagnostic.h"
#include "protocheck/semantic/type_evaluator.h"
#include "protocheck/types/type_var_context.h"
#include "protocheck/types/types.h"
#include <llvm/ADT/SmallVector.h>
#include <cstdint>

namespace protocheck {
namespace semantic {

// Protocol comparisons currently in progress. A comparison that is already on
// the stack is assumed to succeed, which breaks cycles through
// self-referential protocols.
class ProtocolAssignmentStack {
public:
    struct Entry {
        types::ClassTypePtr srcType;
        types::ClassTypePtr destType;
    };

    bool contains(const types::ClassTypePtr& srcType, const types::ClassTypePtr& destType) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void push(types::ClassTypePtr srcType, types::ClassTypePtr destType);
    void pop();

private:
    llvm::SmallVector<Entry, 8> entries_;
};

// Checks whether a class satisfies a protocol. With treatSourceAsInstantiable
// the class object itself is compared (members may then come from its
// metaclass); otherwise an instance of the class is. Both types may be given
// in either instance or instantiable form.
bool canAssignClassToProtocol(TypeEvaluator& evaluator, ProtocolAssignmentStack& pendingStack,
                              const types::ClassTypePtr& destType, const types::ClassTypePtr& srcType,
                              DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext, uint32_t flags,
                              bool treatSourceAsInstantiable, int recursionCount);

// Checks whether a module's top-level symbols satisfy a protocol
bool canAssignModuleToProtocol(TypeEvaluator& evaluator, const types::ClassTypePtr& destType,
                               const types::ModuleType& srcType, DiagnosticAddendum* diag,
                               types::TypeVarContext* typeVarContext, uint32_t flags, int recursionCount);

// Compares two specializations of the same generic protocol member by member.
// Used to validate the declared variance of the protocol's type parameters.
bool canAssignProtocolClassToSelf(TypeEvaluator& evaluator, const types::ClassTypePtr& destType,
                                  const types::ClassTypePtr& srcType, int recursionCount = 0);

} // namespace semantic
} // namespace protocheck
