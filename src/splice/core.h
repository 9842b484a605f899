#ifndef SPLICE_CORE_H
#define SPLICE_CORE_H

#include <splice/core/dynamic.h>
#include <splice/core/exception.h>
#include <splice/core/type_definitions.h>

#endif
