#ifndef SPLICE_CORE_TESTING_H
#define SPLICE_CORE_TESTING_H

#include <catch2/catch.hpp>

// Catch needs to be able to print optionals when checks on them fail.
#include <boost/optional/optional_io.hpp>

#include <splice/core/dynamic.h>

#endif
