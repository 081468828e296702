// facet.hpp - Facet
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Facet Core Principles:
//========================================================================
//
// The Errors-Are-Values Principle
// -------------------------------
// Validation never throws. A failure is a value that travels beside
// the result and can be combined, recovered from or reported.
//
//
// The Accumulation Principle
// --------------------------
// Independent checks report every failure, in the order they were made.
// Dependent checks stop at the first failure, since later steps have
// nothing to work on.
//
//
// The Located-Failure Principle
// -----------------------------
// Every error knows where it happened. Validators descend through a
// context path and errors capture it.
//
//
// The Non-Destructive Update Principle
// ------------------------------------
// Optics read and rebuild; they never mutate what they are given.
// Updating through a missing path leaves the structure as it was.
//
//========================================================================


#ifndef FACET_HPP
#define FACET_HPP

#include "facet_core.hpp"
#include "facet_either.hpp"
#include "facet_monoid.hpp"
#include "facet_validation.hpp"
#include "facet_validation_bind.hpp"
#include "facet_validate.hpp"
#include "facet_validate_bind.hpp"
#include "facet_lens.hpp"
#include "facet_prism.hpp"
#include "facet_optional.hpp"
#include "facet_iso.hpp"
#include "facet_format.hpp"

#endif
