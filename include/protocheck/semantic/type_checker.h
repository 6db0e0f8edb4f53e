#pragma once

#include "protocheck/diagnostic.h"
#include "protocheck/error_reporter.h"
#include "protocheck/semantic/protocols.h"
#include "protocheck/semantic/type_evaluator.h"
#include "protocheck/source_location.h"
#include "protocheck/types/builtins.h"
#include "protocheck/types/type_store.h"
#include "protocheck/types/type_utils.h"
#include "protocheck/types/types.h"
#include <string>
#include <vector>

namespace protocheck {
namespace semantic {

// Assignability checker built around the protocol matcher. Implements the
// evaluator services the matcher needs and reports failures through an
// ErrorReporter.
class TypeChecker : public TypeEvaluator {
public:
    TypeChecker(ErrorReporter& errorReporter, types::TypeStore& typeStore);

    void setMaxDiagnosticDepth(int depth) { maxDiagnosticDepth_ = depth; }
    void setMaxDiagnosticLineCount(int count) { maxDiagnosticLineCount_ = count; }
    // Trace protocol comparisons to stderr
    void setVerbose(bool verbose) { verbose_ = verbose; }
    // Overrides the class that stands in for TypedDict classes
    void setTypedDictClass(types::ClassTypePtr classType) { typedDictClass_ = std::move(classType); }

    const types::BuiltinTypes& getBuiltins() const { return builtins_; }
    const ProtocolAssignmentStack& getProtocolAssignmentStack() const { return protocolAssignmentStack_; }

    // Reports E300 if assignedType cannot be assigned to declaredType
    bool checkAssignment(const types::TypePtr& declaredType, const types::TypePtr& assignedType,
                         const SourceLocation& location);

    // Reports E301 (class or instance) or E302 (module) if the candidate
    // does not satisfy the protocol. An instantiable class candidate is
    // compared as a class object.
    bool checkProtocolAssignment(const types::ClassTypePtr& protocolType, const types::TypePtr& candidateType,
                                 const SourceLocation& location);

    // Reports W100 for every type parameter whose declared variance does not
    // match how the protocol's members use it
    bool validateProtocolTypeParamVariance(const types::ClassTypePtr& protocolClass, const SourceLocation& location);

    bool assignType(const types::TypePtr& destType, const types::TypePtr& srcType, DiagnosticAddendum* diag,
                    types::TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) override;

    types::TypePtr bindFunctionToClassOrObject(const types::TypePtr& baseType, const types::TypePtr& memberType,
                                               const types::ClassTypePtr& memberClass, int recursionCount,
                                               bool treatConstructorAsClassMember = false,
                                               const types::TypePtr& firstParamType = nullptr) override;

    void inferReturnTypeIfNecessary(const types::TypePtr& type) override;

    bool assignProperty(const types::ClassTypePtr& destPropertyType, const types::ClassTypePtr& srcPropertyType,
                        const types::ClassType& destOwner, const types::ClassType& srcOwner, DiagnosticAddendum* diag,
                        types::TypeVarContext* typeVarContext, const types::TypeVarContext* selfTypeVarContext,
                        int recursionCount) override;

    types::TypePtr getGetterTypeFromProperty(const types::ClassType& propertyClass, bool inferTypeIfNeeded) override;

    bool verifyTypeArgumentsAssignable(const types::ClassType& destType, const types::ClassType& srcType,
                                       DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext,
                                       uint32_t flags, int recursionCount) override;

    types::ClassTypePtr getTypedDictClassType() override;

    types::TypePtr getDeclaredTypeOfSymbol(const types::Symbol& symbol) override;
    types::TypePtr getEffectiveTypeOfSymbol(const types::Symbol& symbol) override;
    types::TypePtr getTypeOfMember(const types::ClassMember& member) override;

private:
    ErrorReporter& errorReporter_;
    types::TypeStore& typeStore_;
    types::BuiltinTypes builtins_;
    ProtocolAssignmentStack protocolAssignmentStack_;
    types::ClassTypePtr typedDictClass_;
    types::ClassTypePtr varianceDummyClass_;
    int maxDiagnosticDepth_ = defaultMaxDiagnosticDepth;
    int maxDiagnosticLineCount_ = defaultMaxDiagnosticLineCount;
    bool verbose_ = false;

    // Type variables
    bool assignTypeToTypeVar(const types::TypeVarType& destTypeVar, const types::TypePtr& srcType,
                             DiagnosticAddendum* diag, types::TypeVarContext& typeVarContext, uint32_t flags,
                             int recursionCount);
    bool assignInvariant(const types::TypePtr& destType, const types::TypePtr& srcType, DiagnosticAddendum* diag,
                         types::TypeVarContext* typeVarContext, uint32_t flags, int recursionCount);

    // Classes
    bool assignToClass(const types::ClassTypePtr& destType, const types::TypePtr& srcType, DiagnosticAddendum* diag,
                       types::TypeVarContext* typeVarContext, uint32_t flags, int recursionCount);
    bool assignClassToClass(const types::ClassTypePtr& destType, const types::ClassTypePtr& srcType,
                            DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext, uint32_t flags,
                            int recursionCount);
    bool assignClassToProtocol(const types::ClassTypePtr& destType, const types::ClassTypePtr& srcType,
                               DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext, uint32_t flags,
                               bool treatSourceAsInstantiable, int recursionCount);

    // Callables
    bool assignToCallable(const types::TypePtr& destType, const types::TypePtr& srcType, DiagnosticAddendum* diag,
                          types::TypeVarContext* typeVarContext, uint32_t flags, int recursionCount);
    bool assignFunction(const types::FunctionType& destType, const types::FunctionType& srcType,
                        DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext, uint32_t flags,
                        int recursionCount);
    bool assignFunctionParam(const types::TypePtr& destParamType, const types::TypePtr& srcParamType,
                             size_t paramIndex, DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext,
                             uint32_t flags, int recursionCount);
    // Bound "__call__" of a class instance, or nullptr
    types::TypePtr getBoundCallMethod(const types::TypePtr& objectType, int recursionCount);

    types::TypePtr bindFunction(const types::TypePtr& baseType, const types::FunctionTypePtr& function,
                                const types::ClassTypePtr& memberClass, int recursionCount,
                                bool treatConstructorAsClassMember, const types::TypePtr& firstParamType);
    types::TypePtr partiallySpecializeFunctionForBoundClassOrObject(const types::FunctionTypePtr& function,
                                                                    const types::TypePtr& firstParamType,
                                                                    bool stripFirstParam, int recursionCount);

    void addTypeMismatch(DiagnosticAddendum* diag, const types::TypePtr& srcType, const types::TypePtr& destType);
    void trace(const std::string& message) const;
};

} // namespace semantic
} // namespace protocheck
