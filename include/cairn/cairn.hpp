#pragma once

/** \file cairn.hpp
 *  \brief Umbrella header for the Cairn embedded vector store client.
 */

#include "cairn/client.hpp"
#include "cairn/collection.hpp"
#include "cairn/error.hpp"
#include "cairn/filter_expr.hpp"
#include "cairn/metadata/metadata.hpp"
#include "cairn/schema.hpp"
