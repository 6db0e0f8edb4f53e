#include "protocheck/semantic/type_checker.h"
#include "protocheck/semantic/protocols.h"
#include "protocheck/error_reporter.h"
#include "protocheck/source_location.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace protocheck;
using namespace protocheck::test;
using types::FunctionParam;
using types::Variance;

namespace {

types::ClassTypePtr createProtocol(CheckerFixture& f, const std::string& name) {
    return f.builtins().createClass(f.store, name, types::ClassTypeFlags::ProtocolClass);
}

void finalizeProtocol(CheckerFixture& f, const types::ClassTypePtr& protocol) {
    f.builtins().finalizeClass(*protocol, {f.builtins().protocolClass});
}

bool hasWarning(const ErrorReporter& reporter, const std::string& message) {
    for (const auto& error : reporter.getErrors()) {
        if (error.level == ErrorLevel::Warning && error.message == message) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(protocol_variance_return_only_should_be_covariant) {
    CheckerFixture f;
    types::ClassTypePtr source = createProtocol(f, "Source");
    types::TypeVarTypePtr t = f.builtins().addTypeParameter(*source, "T");
    finalizeProtocol(f, source);
    addMethod(source, makeMethod("get", {}, t));

    ASSERT(!f.checker.validateProtocolTypeParamVariance(source, SourceLocation(1, 7)), "Invariant T is reported");
    ASSERT_EQ(f.reporter.getWarningCount(), 1, "One warning");
    ASSERT_EQ(f.reporter.getErrorCount(), 0, "Variance problems are warnings");

    const CheckerError& warning = f.reporter.getErrors().back();
    ASSERT_EQ(warning.errorCode.code, "W100", "Variance warning is W100");
    ASSERT_EQ(warning.errorCode.category, "variance", "Variance category");
    ASSERT_EQ(warning.message, "Type variable \"T\" used in generic protocol \"Source\" should be covariant",
              "Warning message");
}

TEST(protocol_variance_param_only_contravariant) {
    CheckerFixture f;
    types::ClassTypePtr sink = createProtocol(f, "Sink");
    types::TypeVarTypePtr t = f.builtins().addTypeParameter(*sink, "T_contra", Variance::Contravariant);
    finalizeProtocol(f, sink);
    addMethod(sink, makeMethod("send", {FunctionParam("item", t)}, types::NoneType::create()));

    ASSERT(f.checker.validateProtocolTypeParamVariance(sink, SourceLocation(1, 1)), "Declared variance matches");
    ASSERT_EQ(f.reporter.getWarningCount(), 0, "No warnings");

    types::ClassTypePtr wrong = createProtocol(f, "CovariantSink");
    types::TypeVarTypePtr u = f.builtins().addTypeParameter(*wrong, "T_co", Variance::Covariant);
    finalizeProtocol(f, wrong);
    addMethod(wrong, makeMethod("send", {FunctionParam("item", u)}, types::NoneType::create()));

    ASSERT(!f.checker.validateProtocolTypeParamVariance(wrong, SourceLocation(2, 1)), "Covariant T_co is reported");
    ASSERT(hasWarning(f.reporter,
                      "Type variable \"T_co\" used in generic protocol \"CovariantSink\" should be contravariant"),
           "Contravariance suggested");
}

TEST(protocol_variance_mutable_attribute_invariant) {
    CheckerFixture f;
    types::ClassTypePtr holder = createProtocol(f, "Holder");
    types::TypeVarTypePtr t = f.builtins().addTypeParameter(*holder, "T_co", Variance::Covariant);
    finalizeProtocol(f, holder);
    addVariable(holder, "value", t);

    ASSERT(!f.checker.validateProtocolTypeParamVariance(holder, SourceLocation(1, 1)), "Mutable attribute");
    ASSERT(hasWarning(f.reporter, "Type variable \"T_co\" used in generic protocol \"Holder\" should be invariant"),
           "Invariance suggested");
}

TEST(protocol_variance_read_only_property) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    types::ClassTypePtr view = createProtocol(f, "View");
    types::TypeVarTypePtr t = b.addTypeParameter(*view, "T_co", Variance::Covariant);
    finalizeProtocol(f, view);
    addProperty(view, "current", b.createProperty(f.store, makeMethod("current", {}, t)));

    ASSERT(f.checker.validateProtocolTypeParamVariance(view, SourceLocation(1, 1)),
           "Read-only property is covariant");
    ASSERT_EQ(f.reporter.getWarningCount(), 0, "No warnings");
}

TEST(protocol_variance_each_parameter) {
    CheckerFixture f;
    types::ClassTypePtr mapping = createProtocol(f, "Lookup");
    types::TypeVarTypePtr k = f.builtins().addTypeParameter(*mapping, "K");
    types::TypeVarTypePtr v = f.builtins().addTypeParameter(*mapping, "V");
    finalizeProtocol(f, mapping);
    addMethod(mapping, makeMethod("lookup", {FunctionParam("key", k)}, v));

    ASSERT(!f.checker.validateProtocolTypeParamVariance(mapping, SourceLocation(1, 1)), "Both are misdeclared");
    ASSERT_EQ(f.reporter.getWarningCount(), 2, "One warning per parameter");
    ASSERT(hasWarning(f.reporter, "Type variable \"K\" used in generic protocol \"Lookup\" should be contravariant"),
           "K is contravariant");
    ASSERT(hasWarning(f.reporter, "Type variable \"V\" used in generic protocol \"Lookup\" should be covariant"),
           "V is covariant");
}

TEST(protocol_variance_skips_non_generic) {
    CheckerFixture f;
    types::ClassTypePtr plain = f.builtins().declareProtocol(f.store, "Plain");
    addMethod(plain, makeMethod("run", {}, types::NoneType::create()));

    ASSERT(f.checker.validateProtocolTypeParamVariance(plain, SourceLocation(1, 1)), "Nothing to validate");

    types::ClassTypePtr box = f.builtins().createClass(f.store, "Box");
    f.builtins().addTypeParameter(*box, "T");
    f.builtins().finalizeClass(*box);
    ASSERT(f.checker.validateProtocolTypeParamVariance(box, SourceLocation(2, 1)), "Not a protocol");
    ASSERT_EQ(f.reporter.getWarningCount(), 0, "No warnings");
}

TEST(protocol_variance_self_assignment) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    types::ClassTypePtr source = createProtocol(f, "Source");
    types::TypeVarTypePtr t = b.addTypeParameter(*source, "T_co", Variance::Covariant);
    finalizeProtocol(f, source);
    addMethod(source, makeMethod("get", {}, t));

    auto specializeSource = [&source](const types::TypePtr& typeArg) {
        return types::ClassType::cloneForSpecialization(*source, std::vector<types::TypePtr>{typeArg}, true);
    };

    ASSERT(semantic::canAssignProtocolClassToSelf(f.checker, specializeSource(b.floatInstance()),
                                                  specializeSource(b.intInstance())),
           "Source[int] to Source[float]");
    ASSERT(!semantic::canAssignProtocolClassToSelf(f.checker, specializeSource(b.intInstance()),
                                                   specializeSource(b.strInstance())),
           "Source[str] to Source[int]");
}

TEST(protocol_variance_self_assignment_mutable_attribute) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    types::ClassTypePtr holder = createProtocol(f, "Holder");
    types::TypeVarTypePtr t = b.addTypeParameter(*holder, "T");
    finalizeProtocol(f, holder);
    addVariable(holder, "value", t);

    auto specializeHolder = [&holder](const types::TypePtr& typeArg) {
        return types::ClassType::cloneForSpecialization(*holder, std::vector<types::TypePtr>{typeArg}, true);
    };

    ASSERT(!semantic::canAssignProtocolClassToSelf(f.checker, specializeHolder(b.floatInstance()),
                                                   specializeHolder(b.intInstance())),
           "Holder[int] to Holder[float] through a mutable attribute");
    ASSERT(semantic::canAssignProtocolClassToSelf(f.checker, specializeHolder(b.intInstance()),
                                                  specializeHolder(b.intInstance())),
           "Holder[int] to Holder[int]");
}

TEST(protocol_variance_self_assignment_generic_base) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();

    // class Base(Protocol[T]):
    //     value: T
    types::ClassTypePtr base = createProtocol(f, "Base");
    types::TypeVarTypePtr t = b.addTypeParameter(*base, "T");
    finalizeProtocol(f, base);
    addVariable(base, "value", t);

    // class Derived(Base[U_co], Protocol[U_co]): ...
    types::ClassTypePtr derived = createProtocol(f, "Derived");
    types::TypeVarTypePtr u = b.addTypeParameter(*derived, "U_co", Variance::Covariant);
    b.finalizeClass(*derived, {types::ClassType::cloneForSpecialization(*base, std::vector<types::TypePtr>{u}, true),
                               b.protocolClass});

    auto specializeDerived = [&derived](const types::TypePtr& typeArg) {
        return types::ClassType::cloneForSpecialization(*derived, std::vector<types::TypePtr>{typeArg}, true);
    };

    ASSERT(!semantic::canAssignProtocolClassToSelf(f.checker, specializeDerived(b.floatInstance()),
                                                   specializeDerived(b.intInstance())),
           "Mutable attribute of the base makes Derived[int] to Derived[float] fail");
    ASSERT(semantic::canAssignProtocolClassToSelf(f.checker, specializeDerived(b.intInstance()),
                                                  specializeDerived(b.intInstance())),
           "Derived[int] to Derived[int]");

    ASSERT(!f.checker.validateProtocolTypeParamVariance(derived, SourceLocation(1, 1)),
           "Covariant U_co is reported");
    ASSERT(hasWarning(f.reporter, "Type variable \"U_co\" used in generic protocol \"Derived\" should be invariant"),
           "Invariance suggested through the base");
}

void run_protocol_variance_tests() {
    RUN_TEST(protocol_variance_return_only_should_be_covariant);
    RUN_TEST(protocol_variance_param_only_contravariant);
    RUN_TEST(protocol_variance_mutable_attribute_invariant);
    RUN_TEST(protocol_variance_read_only_property);
    RUN_TEST(protocol_variance_each_parameter);
    RUN_TEST(protocol_variance_skips_non_generic);
    RUN_TEST(protocol_variance_self_assignment);
    RUN_TEST(protocol_variance_self_assignment_mutable_attribute);
    RUN_TEST(protocol_variance_self_assignment_generic_base);
}
