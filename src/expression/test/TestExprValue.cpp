#include "ExprValue.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

void test_truthiness() {
    assert(!ExprValue().truthy());
    assert(!ExprValue(false).truthy());
    assert(!ExprValue(0).truthy());
    assert(!ExprValue(std::numeric_limits<double>::quiet_NaN()).truthy());
    assert(!ExprValue("").truthy());
    assert(ExprValue(true).truthy());
    assert(ExprValue(-1).truthy());
    assert(ExprValue("false").truthy());
    std::cout << "test_truthiness passed.\n";
}

void test_to_string() {
    assert(ExprValue().to_string().empty());
    assert(ExprValue(true).to_string() == "true");
    assert(ExprValue(3).to_string() == "3");
    assert(ExprValue(-0.5).to_string() == "-0.5");
    assert(ExprValue(1e20).to_string() == "1e+20");
    assert(ExprValue(std::numeric_limits<double>::infinity()).to_string() == "Infinity");
    std::cout << "test_to_string passed.\n";
}

void test_loose_equality() {
    assert(ExprValue(1).loosely_equals(ExprValue("1")));
    assert(ExprValue("2.5").loosely_equals(ExprValue(2.5)));
    assert(!ExprValue(1).loosely_equals(ExprValue("1.0")));
    assert(ExprValue("ABC").loosely_equals(ExprValue("abc")));
    assert(!ExprValue(true).loosely_equals(ExprValue("true")));
    assert(!ExprValue().loosely_equals(ExprValue("")));
    assert(ExprValue().loosely_equals(ExprValue()));
    std::cout << "test_loose_equality passed.\n";
}

void test_compare() {
    assert(ExprValue(1).compare(ExprValue(2)) == -1);
    assert(ExprValue("b").compare(ExprValue("A")) == 1);
    assert(ExprValue(false).compare(ExprValue(true)) == -1);
    assert(!ExprValue(1).compare(ExprValue("1")).has_value());
    assert(!ExprValue(std::numeric_limits<double>::quiet_NaN()).compare(ExprValue(1)).has_value());
    std::cout << "test_compare passed.\n";
}

int main() {
    test_truthiness();
    test_to_string();
    test_loose_equality();
    test_compare();
    std::cout << "All ExprValue tests passed.\n";
    return 0;
}
