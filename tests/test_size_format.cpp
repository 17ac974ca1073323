#include <catch2/catch.hpp>
#include "size_format.hpp"
#include <string>

using namespace incfile;

TEST_CASE("Sizes below 1KB stay in bytes", "[size]") {
    SizeBucket bucket = format_size(1023);
    REQUIRE(bucket.value == 1023);
    REQUIRE(std::string(bucket.unit) == "B");
    REQUIRE_FALSE(bucket.large);
}

TEST_CASE("Zero bytes", "[size]") {
    SizeBucket bucket = format_size(0);
    REQUIRE(bucket.value == 0);
    REQUIRE(std::string(bucket.unit) == "B");
}

TEST_CASE("Exactly 1KB moves to the next unit", "[size]") {
    SizeBucket bucket = format_size(1024);
    REQUIRE(bucket.value == 1);
    REQUIRE(std::string(bucket.unit) == "KB");
    REQUIRE_FALSE(bucket.large);
}

TEST_CASE("Division truncates", "[size]") {
    SizeBucket bucket = format_size(1024 * 1024 * 5 + 1024 * 1023);
    REQUIRE(bucket.value == 5);
    REQUIRE(std::string(bucket.unit) == "MB");
}

TEST_CASE("Gigabytes are reported as large", "[size]") {
    SizeBucket bucket = format_size(1ULL << 30);
    REQUIRE(bucket.value == 1);
    REQUIRE(std::string(bucket.unit) == "GB");
    REQUIRE(bucket.large);
}

TEST_CASE("Terabyte is the last unit", "[size][edge]") {
    SizeBucket pb = format_size(1ULL << 50);
    REQUIRE(pb.value == 1024);
    REQUIRE(std::string(pb.unit) == "TB");
    REQUIRE(pb.large);

    SizeBucket max = format_size(UINT64_MAX);
    REQUIRE(std::string(max.unit) == "TB");
    REQUIRE(max.value == (UINT64_MAX >> 40));
}

TEST_CASE("Value stays below 1024 until TB", "[size]") {
    for (std::uint64_t n = 1; n < (1ULL << 40); n = n * 3 + 7) {
        SizeBucket bucket = format_size(n);
        REQUIRE(bucket.value < 1024);
    }
}

TEST_CASE("describe_size appends the hint only when large", "[size]") {
    REQUIRE(describe_size(5000) == "4KB");
    REQUIRE(describe_size(3ULL << 30) == "3GB (this may take a while)");
}
