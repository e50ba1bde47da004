#pragma once

namespace perpcore::tests {

void test_funding_rate_sweep();
void test_funding_settlement_sign();
void test_funding_clamps_at_zero();
void test_funding_precedes_mutation();

}  // namespace perpcore::tests
