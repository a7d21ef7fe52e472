#pragma once

#include "state_parameterization.hpp"

// |<a|b>|^2 for two pure states of equal dimension.
double fidelity(const StateVector& a, const StateVector& b);
