/**
 * @file lazycsv.h
 * @brief Umbrella header for liblazycsv.
 *
 * liblazycsv scans a caller-owned CSV buffer without copying it. Cells are
 * located with Google Highway vector compares and decoded only on request.
 *
 * @see csv.h for the iterator engine and the fixed-width row adapter.
 * @see cell.h for lazy cell decoding.
 */

#ifndef LAZYCSV_LAZYCSV_H
#define LAZYCSV_LAZYCSV_H

#include "lazycsv/boundary_scanner.h"
#include "lazycsv/cell.h"
#include "lazycsv/cell_recognizer.h"
#include "lazycsv/common_defs.h"
#include "lazycsv/csv.h"
#include "lazycsv/debug.h"
#include "lazycsv/dialect.h"
#include "lazycsv/error.h"
#include "lazycsv/io_util.h"
#include "lazycsv/mem_util.h"
#include "lazycsv/simd_info.h"
#include "lazycsv/utf8.h"

#endif // LAZYCSV_LAZYCSV_H
