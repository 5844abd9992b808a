/*
================================================================================
EXAMPLE 03: CYCLING AND COMPUTED PARTITIONS - Client Version Rotation
================================================================================
DIFFICULTY: Intermediate
GENERATION TYPE: Pairwise, exported as test-runner rows

PROBLEM DESCRIPTION
-------------------
An API must accept requests from several client versions. The versions are
interchangeable for most tests, so they form one partition whose value
rotates from row to row. Request payload sizes are drawn when a row is read.
Rows are exported as parameter-name maps for a data-driven test runner.

INPUT MODEL
-----------
Parameters:
    Client    = {"stable" cycling over 116.0, 116.1, 116.2, "beta" = 117.0}
    Transport = {HTTP/1.1, HTTP/2}
    Payload   = {"small" computed 1..1024 bytes, "large" = 1048576 bytes}

Rules:
    "Beta clients use HTTP/2 only"

FEATURES DEMONSTRATED
---------------------
- cycling()                      Partition rotating through equivalent values
- computed()                     Partition producing its value on each read
- constant(name, value)          Named constant partition
- CombinationTable::asRowMaps()  Runner-friendly export
- InputBuilder / builder()       Fluent input construction

================================================================================
*/

#include <iostream>
#include <pairgen/pairgen.h>
#include <random>
#include <string>

using namespace pairgen;

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: Cycling Client Versions\n";
    std::cout << "================================================================\n\n";

    try {
        std::mt19937 rng(7);
        std::uniform_int_distribution<int> smallSize(1, 1024);

        // ====================================================================
        // INPUT MODEL
        // ====================================================================
        CombinationTable table = builder()
            .parameter("Client",
                       { cycling("stable", { std::string("116.0"), std::string("116.1"), std::string("116.2") }),
                         constant("beta", std::string("117.0")) })
            .parameter("Transport", { constant("HTTP/1.1"), constant("HTTP/2") })
            .parameter("Payload",
                       { computed("small", [&] { return Value(smallSize(rng)); }),
                         constant("large", 1048576) })
            .rule("Transport", rules::implies("Beta clients use HTTP/2 only",
                                              predicates::nameIs("beta"),
                                              predicates::parameterNameIs("Transport"),
                                              predicates::nameIs("HTTP/2")))
            .seed(1)
            .generatePairwise();

        // ====================================================================
        // ROWS AS PARTITION KEYS
        // ====================================================================
        std::cout << "COMBINATIONS\n";
        std::cout << "------------\n";
        for (const auto& row : table)
            std::cout << "  " << row.description() << "\n";
        std::cout << "\n";

        // ====================================================================
        // ROWS AS RUNNER DATA (values are read per export)
        // ====================================================================
        std::cout << "RUNNER DATA (two exports)\n";
        std::cout << "-------------------------\n";
        for (int pass = 1; pass <= 2; ++pass) {
            std::cout << "Export " << pass << ":\n";
            for (const auto& row : table.asRowMaps()) {
                std::cout << "  client=" << row.at("Client")
                          << " transport=" << row.at("Transport")
                          << " payload=" << row.at("Payload") << "\n";
            }
        }

        std::cout << "\nINTERPRETATION\n";
        std::cout << "--------------\n";
        std::cout << "The combination keys stay fixed while the stable client version\n";
        std::cout << "and the small payload size change on every read.\n";

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
