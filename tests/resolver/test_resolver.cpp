// tests/resolver/test_resolver.cpp
#define BOOST_TEST_MODULE ResolverTests
#include <boost/test/unit_test.hpp>

#include "cmdschema/resolver/resolver.hpp"
#include "../util/test_catalog_builder.hpp"

using namespace cmdschema;
using cmdschema::resolver::RawInvocation;
using cmdschema::resolver::Resolver;
using cmdschema::testing::declaration;
using cmdschema::testing::finalized_registry;
using cmdschema::testing::option;
using cmdschema::testing::positional;

namespace {

std::shared_ptr<const registry::Registry> sample_registry() {
    auto platform = option("platform", "choice", true);
    platform.choices = {"ios", "android"};

    auto coverage = option("coverage", "boolean");
    coverage.default_value = "false";

    auto retries = option("retries", "integer");
    retries.default_value = "1";

    auto files = positional("files", "string", false);
    files.variadic = true;

    return finalized_registry(
        {declaration("build", {platform}),
         declaration("test", {coverage, retries, option("tag", "string")}),
         declaration("copy", {positional("source", "string"),
                              positional("target", "string", false),
                              option("force", "boolean")}),
         declaration("lint", {positional("dir", "string"), files})});
}

struct ResolverFixture {
    ResolverFixture() : resolver(sample_registry()) {}

    RawInvocation invocation(const std::string& command) const {
        RawInvocation raw;
        raw.command = command;
        return raw;
    }

    Resolver resolver;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(ConstructionTests)

BOOST_AUTO_TEST_CASE(test_requires_finalized_registry) {
    BOOST_CHECK_THROW(Resolver(nullptr), errors::RegistryStateError);

    auto loading = std::make_shared<registry::Registry>();
    BOOST_CHECK_THROW(Resolver{loading}, errors::RegistryStateError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ResolveTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(test_choice_option) {
    auto ctx = resolver.resolve(invocation("build").option("platform", "ios"));
    BOOST_CHECK_EQUAL(ctx.command(), "build");
    BOOST_CHECK_EQUAL(ctx.get_string("platform"), "ios");
    BOOST_CHECK(ctx.is_user_provided("platform"));
}

BOOST_AUTO_TEST_CASE(test_invalid_choice) {
    try {
        resolver.resolve(invocation("build").option("platform", "windows"));
        BOOST_FAIL("expected InvalidChoiceError");
    } catch (const errors::InvalidChoiceError& e) {
        BOOST_CHECK_EQUAL(e.argument(), "platform");
        BOOST_CHECK_EQUAL(e.value(), "windows");
        BOOST_CHECK(e.allowed() ==
                    std::vector<std::string>({"ios", "android"}));
    }
}

BOOST_AUTO_TEST_CASE(test_boolean_default) {
    auto ctx = resolver.resolve(invocation("test"));
    BOOST_CHECK(ctx.get_bool("coverage") == false);
    BOOST_CHECK(!ctx.is_user_provided("coverage"));
    BOOST_CHECK_EQUAL(ctx.get_int("retries"), 1);
}

BOOST_AUTO_TEST_CASE(test_boolean_explicit) {
    auto ctx = resolver.resolve(invocation("test").option("coverage", "true"));
    BOOST_CHECK(ctx.get_bool("coverage") == true);
    BOOST_CHECK(ctx.is_user_provided("coverage"));
}

BOOST_AUTO_TEST_CASE(test_boolean_coercion_failure) {
    try {
        resolver.resolve(invocation("test").option("coverage", "yes"));
        BOOST_FAIL("expected TypeCoercionError");
    } catch (const errors::TypeCoercionError& e) {
        BOOST_CHECK_EQUAL(e.argument(), "coverage");
        BOOST_CHECK_EQUAL(e.value(), "yes");
        BOOST_CHECK_EQUAL(e.expected_type(), "boolean");
    }
}

BOOST_AUTO_TEST_CASE(test_integer_coercion) {
    auto ctx = resolver.resolve(invocation("test").option("retries", "-3"));
    BOOST_CHECK_EQUAL(ctx.get_int("retries"), -3);

    BOOST_CHECK_THROW(
        resolver.resolve(invocation("test").option("retries", "three")),
        errors::TypeCoercionError);
}

BOOST_AUTO_TEST_CASE(test_missing_required_option) {
    try {
        resolver.resolve(invocation("build"));
        BOOST_FAIL("expected MissingArgumentError");
    } catch (const errors::MissingArgumentError& e) {
        BOOST_CHECK_EQUAL(e.command(), "build");
        BOOST_CHECK_EQUAL(e.argument(), "platform");
    }
}

BOOST_AUTO_TEST_CASE(test_missing_required_positional) {
    try {
        resolver.resolve(invocation("copy"));
        BOOST_FAIL("expected MissingArgumentError");
    } catch (const errors::MissingArgumentError& e) {
        BOOST_CHECK_EQUAL(e.argument(), "source");
    }
}

BOOST_AUTO_TEST_CASE(test_unset_marker) {
    auto ctx = resolver.resolve(invocation("copy").arg("a.txt"));
    BOOST_CHECK(ctx.has_argument("target"));
    BOOST_CHECK(!ctx.is_set("target"));
    BOOST_CHECK(!ctx.values().at("target").has_value());
    BOOST_CHECK(!ctx.get_optional<std::string>("target"));
    BOOST_CHECK_THROW(ctx.value("target"), std::out_of_range);

    // Unset is distinct from an explicit false
    BOOST_CHECK(!ctx.is_set("force"));
    auto forced = resolver.resolve(
        invocation("copy").arg("a.txt").option("force", "false"));
    BOOST_CHECK(forced.is_set("force"));
    BOOST_CHECK(forced.get_bool("force") == false);
}

BOOST_AUTO_TEST_CASE(test_every_declared_argument_present) {
    auto ctx = resolver.resolve(invocation("test"));
    BOOST_CHECK_EQUAL(ctx.values().size(), 3u);
    BOOST_CHECK(ctx.has_argument("tag"));
    BOOST_CHECK(!ctx.has_argument("platform"));
    BOOST_CHECK_THROW(ctx.value("platform"), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(test_positional_binding) {
    auto ctx = resolver.resolve(
        invocation("copy").arg("a.txt").arg("b.txt").option("force", "true"));
    BOOST_CHECK_EQUAL(ctx.get_string("source"), "a.txt");
    BOOST_CHECK_EQUAL(ctx.get_string("target"), "b.txt");
    BOOST_CHECK(ctx.get_bool("force"));
}

BOOST_AUTO_TEST_CASE(test_unexpected_positional) {
    try {
        resolver.resolve(invocation("copy").arg("a").arg("b").arg("c"));
        BOOST_FAIL("expected UnexpectedArgumentError");
    } catch (const errors::UnexpectedArgumentError& e) {
        BOOST_CHECK_EQUAL(e.command(), "copy");
        BOOST_CHECK_EQUAL(e.token(), "c");
    }
}

BOOST_AUTO_TEST_CASE(test_unknown_command) {
    try {
        resolver.resolve(invocation("deploy"));
        BOOST_FAIL("expected UnknownCommandError");
    } catch (const errors::UnknownCommandError& e) {
        BOOST_CHECK_EQUAL(e.command(), "deploy");
    }
}

BOOST_AUTO_TEST_CASE(test_unknown_option) {
    try {
        resolver.resolve(
            invocation("build").option("platform", "ios").option("plaform",
                                                                 "ios"));
        BOOST_FAIL("expected UnknownOptionError");
    } catch (const errors::UnknownOptionError& e) {
        BOOST_CHECK_EQUAL(e.command(), "build");
        BOOST_CHECK_EQUAL(e.flag(), "plaform");
    }
}

BOOST_AUTO_TEST_CASE(test_missing_reported_before_unknown_option) {
    try {
        resolver.resolve(invocation("build").option("platfrom", "ios"));
        BOOST_FAIL("expected MissingArgumentError");
    } catch (const errors::MissingArgumentError& e) {
        BOOST_CHECK_EQUAL(e.argument(), "platform");
    }
}

BOOST_AUTO_TEST_CASE(test_coercion_reported_before_unknown_option) {
    BOOST_CHECK_THROW(resolver.resolve(invocation("build")
                                           .option("platform", "windows")
                                           .option("x", "1")),
                      errors::InvalidChoiceError);
    BOOST_CHECK_THROW(
        resolver.resolve(invocation("copy").arg("a").arg("b").arg("c").option(
            "x", "1")),
        errors::UnexpectedArgumentError);
}

BOOST_AUTO_TEST_CASE(test_positional_name_is_not_a_flag) {
    BOOST_CHECK_THROW(
        resolver.resolve(invocation("copy").arg("a").option("source", "b")),
        errors::UnknownOptionError);
}

BOOST_AUTO_TEST_CASE(test_last_flag_wins) {
    auto ctx = resolver.resolve(invocation("build")
                                    .option("platform", "ios")
                                    .option("platform", "android"));
    BOOST_CHECK_EQUAL(ctx.get_string("platform"), "android");
    BOOST_CHECK_EQUAL(ctx.raw_options().at("platform"), "android");
}

BOOST_AUTO_TEST_CASE(test_earlier_invalid_value_overridden) {
    auto ctx = resolver.resolve(invocation("build")
                                    .option("platform", "windows")
                                    .option("platform", "ios"));
    BOOST_CHECK_EQUAL(ctx.get_string("platform"), "ios");
}

BOOST_AUTO_TEST_CASE(test_variadic_positional) {
    auto ctx = resolver.resolve(
        invocation("lint").arg("src").arg("a.cpp").arg("b.cpp"));
    BOOST_CHECK_EQUAL(ctx.get_string("dir"), "src");
    BOOST_CHECK(ctx.get_list("files") ==
                schema::StringList({"a.cpp", "b.cpp"}));

    auto empty = resolver.resolve(invocation("lint").arg("src"));
    BOOST_CHECK(!empty.is_set("files"));
    BOOST_CHECK(!empty.is_user_provided("files"));
}

BOOST_AUTO_TEST_CASE(test_idempotent) {
    auto raw = invocation("test").option("coverage", "true").option("tag", "x");
    auto first = resolver.resolve(raw);
    auto second = resolver.resolve(raw);
    BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TryResolveTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(test_success) {
    auto result =
        resolver.try_resolve(invocation("build").option("platform", "ios"));
    BOOST_REQUIRE(result.ok());
    BOOST_CHECK(static_cast<bool>(result));
    BOOST_CHECK_EQUAL(result.context().get_string("platform"), "ios");
    BOOST_CHECK_THROW(result.error(), std::logic_error);
}

BOOST_AUTO_TEST_CASE(test_failure) {
    auto result = resolver.try_resolve(invocation("nope"));
    BOOST_REQUIRE(!result.ok());
    BOOST_CHECK(result.error().code() == errors::ErrorCode::UnknownCommand);
    BOOST_CHECK(dynamic_cast<const errors::UnknownCommandError*>(
                    &result.error()) != nullptr);
    BOOST_CHECK_THROW(result.context(), std::logic_error);
}

BOOST_AUTO_TEST_CASE(test_failure_keeps_concrete_type) {
    auto result = resolver.try_resolve(
        invocation("build").option("platform", "windows"));
    BOOST_REQUIRE(!result.ok());
    const auto* choice =
        dynamic_cast<const errors::InvalidChoiceError*>(&result.error());
    BOOST_REQUIRE(choice != nullptr);
    BOOST_CHECK_EQUAL(choice->value(), "windows");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TokenTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(test_flag_forms) {
    auto spaced = resolver.resolve_tokens({"build", "--platform", "ios"});
    auto joined = resolver.resolve_tokens({"build", "--platform=ios"});
    BOOST_CHECK(spaced.values() == joined.values());
    BOOST_CHECK_EQUAL(joined.get_string("platform"), "ios");
}

BOOST_AUTO_TEST_CASE(test_bare_boolean_flag) {
    auto ctx = resolver.resolve_tokens({"test", "--coverage"});
    BOOST_CHECK(ctx.get_bool("coverage"));

    auto followed =
        resolver.resolve_tokens({"test", "--coverage", "--tag", "x"});
    BOOST_CHECK(followed.get_bool("coverage"));
    BOOST_CHECK_EQUAL(followed.get_string("tag"), "x");
}

BOOST_AUTO_TEST_CASE(test_boolean_with_value) {
    auto ctx = resolver.resolve_tokens({"test", "--coverage", "true"});
    BOOST_CHECK(ctx.get_bool("coverage"));
    BOOST_CHECK_THROW(resolver.resolve_tokens({"test", "--coverage", "yes"}),
                      errors::TypeCoercionError);
}

BOOST_AUTO_TEST_CASE(test_value_flag_without_value) {
    BOOST_CHECK_THROW(resolver.resolve_tokens({"build", "--platform"}),
                      errors::MissingArgumentError);
}

BOOST_AUTO_TEST_CASE(test_repeated_flag_without_value) {
    auto ctx =
        resolver.resolve_tokens({"build", "--platform", "--platform", "ios"});
    BOOST_CHECK_EQUAL(ctx.get_string("platform"), "ios");

    auto joined =
        resolver.resolve_tokens({"build", "--platform", "--platform=android"});
    BOOST_CHECK_EQUAL(joined.get_string("platform"), "android");

    try {
        resolver.resolve_tokens({"build", "--platform", "ios", "--platform"});
        BOOST_FAIL("expected MissingArgumentError");
    } catch (const errors::MissingArgumentError& e) {
        BOOST_CHECK_EQUAL(e.argument(), "platform");
    }
}

BOOST_AUTO_TEST_CASE(test_unknown_flag_token) {
    BOOST_CHECK_THROW(resolver.resolve_tokens({"test", "--verbose"}),
                      errors::UnknownOptionError);
}

BOOST_AUTO_TEST_CASE(test_double_dash) {
    auto ctx = resolver.resolve_tokens({"copy", "--", "--force", "x"});
    BOOST_CHECK_EQUAL(ctx.get_string("source"), "--force");
    BOOST_CHECK_EQUAL(ctx.get_string("target"), "x");
    BOOST_CHECK(!ctx.is_set("force"));
}

BOOST_AUTO_TEST_CASE(test_split_tokens) {
    auto raw = resolver.split_tokens(
        {"copy", "a", "--force", "b", "--", "c"});
    BOOST_CHECK_EQUAL(raw.command, "copy");
    BOOST_CHECK(raw.positionals == std::vector<std::string>({"a", "c"}));
    BOOST_REQUIRE_EQUAL(raw.options.size(), 1u);
    BOOST_CHECK_EQUAL(raw.options[0].first, "force");
    BOOST_CHECK_EQUAL(raw.options[0].second, "b");
}

BOOST_AUTO_TEST_CASE(test_empty_argv) {
    BOOST_CHECK_THROW(resolver.resolve_tokens({}), errors::UnknownCommandError);
    auto result = resolver.try_resolve_tokens({});
    BOOST_CHECK(!result.ok());
}

BOOST_AUTO_TEST_CASE(test_try_resolve_tokens) {
    auto result = resolver.try_resolve_tokens({"lint", "src", "a", "b"});
    BOOST_REQUIRE(result.ok());
    BOOST_CHECK_EQUAL(result.context().get_list("files").size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
