/**
 * @file abstep.hpp
 * @brief Primary API: problem construction and fixed-step Adams-Bashforth stepping.
 */
#pragma once

#include "abstep/adams_bashforth.hpp"
#include "abstep/coefficients.hpp"
#include "abstep/problem.hpp"
#include "abstep/types.hpp"
#include "abstep/window.hpp"
