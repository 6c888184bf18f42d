#include <catch2/catch.hpp>
#include <launchpad/core/environment.hpp>

using namespace launchpad;

TEST_CASE("Environment captures a process environment", "[environment]") {
    const char* envp[] = {
        "PATH=/usr/local/bin:/usr/bin",
        "N8N_HOST=",
        "EQUALS=a=b=c",
        "NO_EQUALS_SIGN",
        "=nameless",
        "PATH=/shadowed",
        nullptr
    };

    auto environment = Environment::from_process(envp);

    CHECK(environment.size() == 3);
    CHECK(environment.get("PATH") == std::string("/usr/local/bin:/usr/bin"));
    CHECK(environment.get("EQUALS") == std::string("a=b=c"));
    CHECK(environment.has("N8N_HOST"));
    CHECK_FALSE(environment.has("NO_EQUALS_SIGN"));
}

TEST_CASE("Environment null envp is empty", "[environment]") {
    CHECK(Environment::from_process(nullptr).size() == 0);
}

TEST_CASE("Environment lookups", "[environment]") {
    Environment environment{{"SET", "value"}, {"EMPTY", ""}};

    SECTION("get") {
        CHECK(environment.get("SET") == std::string("value"));
        CHECK(environment.get("EMPTY") == std::string(""));
        CHECK_FALSE(environment.get("MISSING").has_value());
    }

    SECTION("get_or treats empty as unset") {
        CHECK(environment.get_or("SET", "fallback") == "value");
        CHECK(environment.get_or("EMPTY", "fallback") == "fallback");
        CHECK(environment.get_or("MISSING", "fallback") == "fallback");
    }

    SECTION("is_set_nonempty") {
        CHECK(environment.is_set_nonempty("SET"));
        CHECK_FALSE(environment.is_set_nonempty("EMPTY"));
        CHECK_FALSE(environment.is_set_nonempty("MISSING"));
    }
}

TEST_CASE("Environment mutation", "[environment]") {
    Environment environment{{"A", "1"}};

    environment.set("A", "2");
    environment.set("B", "3");
    CHECK(environment.get("A") == std::string("2"));
    CHECK(environment.get("B") == std::string("3"));

    environment.unset("A");
    environment.unset("NEVER_SET");
    CHECK_FALSE(environment.has("A"));
    CHECK(environment.size() == 1);
}

TEST_CASE("Environment to_envp is sorted NAME=value", "[environment]") {
    Environment environment{{"ZETA", "z"}, {"ALPHA", "a=1"}, {"EMPTY", ""}};

    auto envp = environment.to_envp();
    REQUIRE(envp.size() == 3);
    CHECK(envp[0] == "ALPHA=a=1");
    CHECK(envp[1] == "EMPTY=");
    CHECK(envp[2] == "ZETA=z");
}

TEST_CASE("apply_defaults only fills absent keys", "[environment]") {
    Environment environment{{"N8N_PORT", "9000"}, {"N8N_HOST", ""}};

    auto applied = apply_defaults(environment, image_defaults());

    CHECK(applied == image_defaults().size() - 2);
    CHECK(environment.get("N8N_PORT") == std::string("9000"));
    // Set-but-empty is kept, as with a shell ENV line
    CHECK(environment.get("N8N_HOST") == std::string(""));
    CHECK(environment.get("DB_TYPE") == std::string("sqlite"));
    CHECK(environment.get("NODE_ENV") == std::string("production"));

    CHECK(apply_defaults(environment, image_defaults()) == 0);
}

TEST_CASE("Image defaults carry the documented values", "[environment]") {
    Environment environment;
    apply_defaults(environment, image_defaults());

    CHECK(environment.get("N8N_PORT") == std::string("5678"));
    CHECK(environment.get("N8N_HOST") == std::string("0.0.0.0"));
    CHECK(environment.get("DB_TYPE") == std::string("sqlite"));
    CHECK(environment.get("N8N_ENTERPRISE_EVALUATION") == std::string("true"));
    CHECK(environment.get("NODE_ICU_DATA") == std::string("/usr/local/lib/node_modules/full-icu"));
    CHECK(environment.get("SHELL") == std::string("/bin/sh"));
    CHECK_FALSE(environment.has("N8N_ENCRYPTION_KEY"));
}
