/*
================================================================================
EXAMPLE 02: COMBINATORIAL GENERATION - Payment Checkout Matrix
================================================================================
DIFFICULTY: Beginner
GENERATION TYPE: Exhaustive combinatorial, optionally capped

PROBLEM DESCRIPTION
-------------------
A checkout flow accepts several payment methods in several currencies, for
guest and registered customers. Some pairs are not offered: invoices require
a registered account and the wallet provider does not settle JPY. The team
wants every valid combination for the nightly run, and a random sample of a
fixed size for the pre-merge run.

INPUT MODEL
-----------
Parameters:
    Payment   = {Card, Wallet, Invoice}
    Currency  = {EUR, USD, JPY}
    Customer  = {Guest, Registered}

Rules:
    "Invoice needs an account"   Invoice implies Customer = Registered
    "Wallet does not settle JPY" Wallet excludes JPY

FEATURES DEMONSTRATED
---------------------
- where()                        Fluent predicate construction
- TestGenerator                  Generator with tracked options
- limit(), seed()                Capped, reproducible sampling
- store()["result:*"]            Run metadata
- generateCombinatorial(params, limit)  Facade with a cap

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <pairgen/pairgen.h>

using namespace pairgen;

namespace {

ParameterSet checkoutInput()
{
    ParameterSet params;

    params.add("Payment", { constant("Card"), constant("Wallet"), constant("Invoice") },
               { rules::implies("Invoice needs an account",
                                where().nameIs("Invoice"),
                                where().parameterNameIs("Customer"),
                                where().nameIs("Registered")),
                 rules::excludes("Wallet does not settle JPY",
                                 where().parameterNameIs("Payment").nameIs("Wallet"),
                                 where().parameterNameIs("Currency").nameIs("JPY")) });

    params.add("Currency", { constant("EUR"), constant("USD"), constant("JPY") });
    params.add("Customer", { constant("Guest"), constant("Registered") });
    return params;
}

void printTable(const CombinationTable& table)
{
    std::cout << std::left;
    for (std::size_t r = 0; r < table.size(); ++r)
        std::cout << "  " << std::setw(3) << (r + 1) << table[r].key() << "\n";
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Combinatorial Checkout Matrix\n";
    std::cout << "================================================================\n\n";

    try {
        ParameterSet params = checkoutInput();

        // ====================================================================
        // NIGHTLY RUN: EVERY VALID COMBINATION
        // ====================================================================
        std::cout << "NIGHTLY (all valid combinations)\n";
        std::cout << "--------------------------------\n";

        TestGenerator nightly(params.derive());
        nightly.quiet();
        const CombinationTable& all = nightly.generateCombinatorial();
        printTable(all);

        std::cout << "Span:             " << nightly.span() << "\n";
        std::cout << "Valid:            " << all.size() << "\n";
        std::cout << "Rules propagated: "
                  << nightly.store().at("result:PropagatedRules").get<std::size_t>() << "\n";
        for (const auto& a : nightly.propagation().additions)
            std::cout << "  '" << a.rule << "' " << a.from << " -> " << a.to << "\n";
        std::cout << "\n";

        // ====================================================================
        // PRE-MERGE RUN: REPRODUCIBLE SAMPLE OF 5
        // ====================================================================
        std::cout << "PRE-MERGE (sample of 5, seed 42)\n";
        std::cout << "--------------------------------\n";

        TestGenerator premerge(params.derive());
        premerge.quiet();
        premerge.limit(5);
        premerge.seed(42);
        const CombinationTable& sample = premerge.generateCombinatorial();
        printTable(sample);

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Algorithm: " << premerge.store().at("result:Algorithm").get<std::string>() << "\n";
        std::cout << "Runtime:   " << premerge.store().at("result:Runtime").get<double>() << " s\n\n";

        // ====================================================================
        // FACADE
        // ====================================================================
        std::cout << "FACADE (default limit " << DEFAULT_COMBINATORIAL_LIMIT << ")\n";
        std::cout << "------\n";
        CombinationTable capped = generateCombinatorial(params);
        std::cout << tableSummary(params, capped) << "\n";

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
