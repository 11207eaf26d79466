#include <catch2/catch.hpp>
#include <tnid/result.hpp>
#include <memory>
#include <string>

using namespace tnid;

static Result<int> try_double(Result<int> input) {
    TNID_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_assign_sum(Result<int> a, Result<int> b) {
    TNID_TRY_ASSIGN(int x, std::move(a));
    TNID_TRY_ASSIGN(int y, std::move(b));
    return Result<int>::ok(x + y);
}

static Status check_positive(int v) {
    if (v <= 0) {
        return TnidError{TnidError::InvalidArg, "must be positive"};
    }
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(TnidError{TnidError::MalformedUuid, "bad uuid"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == TnidError::MalformedUuid);
    REQUIRE(r.error().message == "bad uuid");
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(TnidError{TnidError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(TnidError{TnidError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    auto ok = Result<int>::ok(3);
    auto err = Result<int>::err(TnidError{TnidError::IO, "fail"});
    REQUIRE(ok.value_or(9) == 3);
    REQUIRE(err.value_or(9) == 9);
}

TEST_CASE("map() transforms Ok value and passes through Err", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return std::to_string(x); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "5");

    auto e = Result<int>::err(TnidError{TnidError::WrongVariant, "v1"});
    bool called = false;
    auto mapped_err = e.map([&](int x) { called = true; return x; });
    REQUIRE(mapped_err.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped_err.error().code == TnidError::WrongVariant);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto chained = Result<int>::ok(5).and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.value() == 15);

    auto failed = Result<int>::err(TnidError{TnidError::InvalidLength, "empty"})
        .and_then([](int x) { return Result<int>::ok(x + 10); });
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == TnidError::InvalidLength);
}

TEST_CASE("map_err() rewrites the error", "[result]") {
    auto r = Result<int>::err(TnidError{TnidError::InvalidCharacter, "bad char"})
        .map_err([](TnidError e) {
            return TnidError{TnidError::MalformedString, "wrapped: " + e.message};
        });
    REQUIRE(r.error().code == TnidError::MalformedString);
    REQUIRE(r.error().message == "wrapped: bad char");

    auto ok = Result<int>::ok(1).map_err([](TnidError e) { return e; });
    REQUIRE(ok.value() == 1);
}

TEST_CASE("TNID_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(TnidError{TnidError::IO, "disk"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().message == "disk");

    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("TNID_TRY_ASSIGN binds values and propagates errors", "[result]") {
    REQUIRE(try_assign_sum(Result<int>::ok(2), Result<int>::ok(3)).value() == 5);

    auto r = try_assign_sum(Result<int>::ok(2),
                            Result<int>::err(TnidError{TnidError::Config, "second"}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "second");
}

TEST_CASE("Status Ok and Err", "[result]") {
    REQUIRE(check_positive(1).is_ok());
    auto s = check_positive(0);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == TnidError::InvalidArg);
}

TEST_CASE("TnidError format() output", "[error]") {
    TnidError e{TnidError::Config, "bad key", "use 32 hex chars", "tnid.toml", 4};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("bad key") != std::string::npos);
    REQUIRE(formatted.find("hint: use 32 hex chars") != std::string::npos);
    REQUIRE(formatted.find("--> tnid.toml:4") != std::string::npos);
}

TEST_CASE("TnidError format() without hint or file", "[error]") {
    TnidError e{TnidError::MalformedString, "missing separator"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[MalformedString]: missing separator");
}

TEST_CASE("TnidError code_name() for all codes", "[error]") {
    REQUIRE(std::string(TnidError::code_name(TnidError::InvalidLength)) == "InvalidLength");
    REQUIRE(std::string(TnidError::code_name(TnidError::InvalidCharacter)) == "InvalidCharacter");
    REQUIRE(std::string(TnidError::code_name(TnidError::MalformedString)) == "MalformedString");
    REQUIRE(std::string(TnidError::code_name(TnidError::MalformedUuid)) == "MalformedUuid");
    REQUIRE(std::string(TnidError::code_name(TnidError::UnknownVariant)) == "UnknownVariant");
    REQUIRE(std::string(TnidError::code_name(TnidError::WrongVariant)) == "WrongVariant");
    REQUIRE(std::string(TnidError::code_name(TnidError::InvalidKeyLength)) == "InvalidKeyLength");
    REQUIRE(std::string(TnidError::code_name(TnidError::NameMismatch)) == "NameMismatch");
    REQUIRE(std::string(TnidError::code_name(TnidError::FilterExhausted)) == "FilterExhausted");
    REQUIRE(std::string(TnidError::code_name(TnidError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(TnidError::code_name(TnidError::Config)) == "Config");
    REQUIRE(std::string(TnidError::code_name(TnidError::IO)) == "IO");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto r2 = Result<std::unique_ptr<int>>::err(TnidError{TnidError::IO, "fail"});
    REQUIRE(r2.is_err());
}
