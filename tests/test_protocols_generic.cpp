#include "protocheck/semantic/type_checker.h"
#include "protocheck/error_reporter.h"
#include "protocheck/source_location.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace protocheck;
using namespace protocheck::test;
using types::FunctionParam;

namespace {

struct GenericProtocol {
    types::ClassTypePtr classType;
    types::TypeVarTypePtr typeParam;
};

// class <name>(Protocol[<param>])
GenericProtocol declareGenericProtocol(CheckerFixture& f, const std::string& name, const std::string& paramName,
                                       types::Variance variance, std::vector<types::TypePtr> bases = {}) {
    const types::BuiltinTypes& b = f.builtins();
    GenericProtocol protocol;
    protocol.classType = b.createClass(f.store, name, types::ClassTypeFlags::ProtocolClass);
    protocol.typeParam = b.addTypeParameter(*protocol.classType, paramName, variance);
    bases.push_back(b.protocolClass);
    b.finalizeClass(*protocol.classType, std::move(bases));
    return protocol;
}

// class SupportsGet(Protocol[T_co]):
//     def get(self) -> T_co: ...
GenericProtocol declareSupportsGet(CheckerFixture& f) {
    GenericProtocol protocol = declareGenericProtocol(f, "SupportsGet", "T_co", types::Variance::Covariant);
    addMethod(protocol.classType, makeMethod("get", {}, protocol.typeParam));
    return protocol;
}

bool isAssignable(CheckerFixture& f, const types::TypePtr& destType, const types::TypePtr& srcType) {
    return f.checker.checkAssignment(destType, srcType, SourceLocation(1, 1));
}

} // namespace

TEST(protocols_generic_solves_type_argument) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    GenericProtocol supportsGet = declareSupportsGet(f);

    types::ClassTypePtr intGetter = b.declareClass(f.store, "IntGetter");
    addMethod(intGetter, makeMethod("get", {}, b.intInstance()));

    ASSERT(isAssignable(f, specialize(supportsGet.classType, {b.intInstance()}), instanceOf(intGetter)),
           "IntGetter is a SupportsGet[int]");
    ASSERT(isAssignable(f, specialize(supportsGet.classType, {b.floatInstance()}), instanceOf(intGetter)),
           "Covariant argument accepts the narrower solution");
    ASSERT(isAssignable(f, instanceOf(supportsGet.classType), instanceOf(intGetter)),
           "Unspecialized protocol only checks members");
    ASSERT(!f.reporter.hasErrors(), "No errors so far");

    ASSERT(!isAssignable(f, specialize(supportsGet.classType, {b.strInstance()}), instanceOf(intGetter)),
           "IntGetter is not a SupportsGet[str]");
    ASSERT(hasNote(f.reporter, "Type parameter \"T_co\" is covariant, but \"int\" is not compatible with \"str\""),
           "Solved argument is compared with the declared one");
}

TEST(protocols_generic_contravariant_parameter) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();

    // class SupportsWrite(Protocol[T_contra]):
    //     def write(self, item: T_contra) -> None: ...
    GenericProtocol supportsWrite = declareGenericProtocol(f, "SupportsWrite", "T_contra",
                                                           types::Variance::Contravariant);
    addMethod(supportsWrite.classType,
              makeMethod("write", {FunctionParam("item", supportsWrite.typeParam)}, types::NoneType::create()));

    types::ClassTypePtr strWriter = b.declareClass(f.store, "StrWriter");
    addMethod(strWriter, makeMethod("write", {FunctionParam("item", b.strInstance())}, types::NoneType::create()));
    types::ClassTypePtr anyWriter = b.declareClass(f.store, "ObjectWriter");
    addMethod(anyWriter, makeMethod("write", {FunctionParam("item", b.objectInstance())}, types::NoneType::create()));

    ASSERT(isAssignable(f, specialize(supportsWrite.classType, {b.strInstance()}), instanceOf(strWriter)),
           "StrWriter writes str");
    ASSERT(isAssignable(f, specialize(supportsWrite.classType, {b.strInstance()}), instanceOf(anyWriter)),
           "A writer of object can write str");
    ASSERT(!isAssignable(f, specialize(supportsWrite.classType, {b.objectInstance()}), instanceOf(strWriter)),
           "StrWriter cannot write arbitrary objects");
}

TEST(protocols_generic_source_class) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    GenericProtocol supportsGet = declareSupportsGet(f);

    // class Box(Generic[T]):
    //     def get(self) -> T: ...
    types::ClassTypePtr box = b.createClass(f.store, "Box");
    types::TypeVarTypePtr t = b.addTypeParameter(*box, "T");
    b.finalizeClass(*box);
    addMethod(box, makeMethod("get", {}, t));

    ASSERT(isAssignable(f, specialize(supportsGet.classType, {b.intInstance()}), specialize(box, {b.intInstance()})),
           "Box[int] is a SupportsGet[int]");
    ASSERT(isAssignable(f, specialize(supportsGet.classType, {b.floatInstance()}), specialize(box, {b.boolInstance()})),
           "Box[bool] is a SupportsGet[float]");
    ASSERT(!isAssignable(f, specialize(supportsGet.classType, {b.intInstance()}), specialize(box, {b.strInstance()})),
           "Box[str] is not a SupportsGet[int]");
}

TEST(protocols_generic_protocol_inheritance) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    GenericProtocol supportsGet = declareSupportsGet(f);

    // class Container(SupportsGet[U_co], Protocol[U_co]):
    //     def __len__(self) -> int: ...
    types::ClassTypePtr container = b.createClass(f.store, "Container", types::ClassTypeFlags::ProtocolClass);
    types::TypeVarTypePtr u = b.addTypeParameter(*container, "U_co", types::Variance::Covariant);
    types::ClassTypePtr getOfU = types::ClassType::cloneForSpecialization(
        *supportsGet.classType, std::vector<types::TypePtr>{u}, true);
    b.finalizeClass(*container, {getOfU, b.protocolClass});
    addMethod(container, makeMethod("__len__", {}, b.intInstance()));

    types::ClassTypePtr intBag = b.declareClass(f.store, "IntBag");
    addMethod(intBag, makeMethod("get", {}, b.intInstance()));
    addMethod(intBag, makeMethod("__len__", {}, b.intInstance()));

    ASSERT(isAssignable(f, specialize(container, {b.intInstance()}), instanceOf(intBag)),
           "Inherited member solves the subclass parameter");
    ASSERT(!isAssignable(f, specialize(container, {b.strInstance()}), instanceOf(intBag)),
           "Inherited member type is checked against the argument");

    types::ClassTypePtr sizedOnly = b.declareClass(f.store, "SizedOnly");
    addMethod(sizedOnly, makeMethod("__len__", {}, b.intInstance()));
    ASSERT(!isAssignable(f, specialize(container, {b.intInstance()}), instanceOf(sizedOnly)),
           "Inherited member is required");
    ASSERT(hasNote(f.reporter, "\"get\" is not present"), "Missing inherited member is named");
}

TEST(protocols_generic_self_type) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();

    // class Copyable(Protocol):
    //     def copy(self) -> Self: ...
    types::ClassTypePtr copyable = b.declareProtocol(f.store, "Copyable");
    addMethod(copyable, makeMethod("copy", {}, types::TypeVarType::createSynthesizedSelf(*copyable)));

    types::ClassTypePtr document = b.declareClass(f.store, "Document");
    addMethod(document, makeMethod("copy", {}, instanceOf(document)));
    ASSERT(isAssignable(f, instanceOf(copyable), instanceOf(document)), "Self resolves to the source class");

    types::ClassTypePtr lossy = b.declareClass(f.store, "Lossy");
    addMethod(lossy, makeMethod("copy", {}, instanceOf(document)));
    ASSERT(!isAssignable(f, instanceOf(copyable), instanceOf(lossy)), "copy must return the same class");
}

TEST(protocols_generic_literal_arguments) {
    CheckerFixture f;
    const types::BuiltinTypes& b = f.builtins();
    GenericProtocol supportsGet = declareSupportsGet(f);

    types::ClassTypePtr box = b.createClass(f.store, "Box");
    types::TypeVarTypePtr t = b.addTypeParameter(*box, "T");
    b.finalizeClass(*box);
    addMethod(box, makeMethod("get", {}, t));

    types::TypePtr three = types::ClassType::cloneWithLiteral(*types::asClass(b.intInstance()), std::string("3"));
    types::TypePtr literalBox = specialize(box, {three});

    ASSERT(isAssignable(f, specialize(supportsGet.classType, {three}), literalBox),
           "Literal type arguments are retained");
    ASSERT(isAssignable(f, specialize(supportsGet.classType, {b.intInstance()}), literalBox),
           "Literal argument fits the wider type");
    ASSERT(!isAssignable(f, specialize(supportsGet.classType, {types::ClassType::cloneWithLiteral(
                                                                  *types::asClass(b.intInstance()), std::string("4"))}),
                         literalBox),
           "Different literal");
}

void run_protocols_generic_tests() {
    RUN_TEST(protocols_generic_solves_type_argument);
    RUN_TEST(protocols_generic_contravariant_parameter);
    RUN_TEST(protocols_generic_source_class);
    RUN_TEST(protocols_generic_protocol_inheritance);
    RUN_TEST(protocols_generic_self_type);
    RUN_TEST(protocols_generic_literal_arguments);
}
