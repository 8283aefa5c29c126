#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <kinect_body_metrics/benchmark.hpp>

CATCH_TEST_CASE("BenchmarkSummary", "[benchmark]")
{
    Benchmark bench;
    bench.materialize = { 1.0, 2.0, 3.0 };
    bench.estimate = { 0.5 };

    auto json = bench.to_json();

    CATCH_REQUIRE(json["mean"]["materialize"].get<double>() == Approx(2.0));
    CATCH_REQUIRE(json["min"]["materialize"].get<double>() == Approx(1.0));
    CATCH_REQUIRE(json["max"]["materialize"].get<double>() == Approx(3.0));
    CATCH_REQUIRE(json["var"]["materialize"].get<double>() == Approx(1.0));

    CATCH_REQUIRE(json["var"]["estimate"].get<double>() == Approx(0.0));
    CATCH_REQUIRE(json["mean"]["capture"].is_null());
    CATCH_REQUIRE(json["max"]["save_json"].is_null());
}
