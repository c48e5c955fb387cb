#ifndef SIZES_H
#define SIZES_H

#ifdef __cplusplus
#include <cstdint>
#define namespace_std std::
#else
#include <stdint.h>
#define namespace_std
#endif

// successor indices stored inline in each state before spilling to the heap
#ifndef FSM_REGEX_INLINE_EDGES
#define FSM_REGEX_INLINE_EDGES 2
#endif

#ifndef FSM_REGEX_STATE_ID_BITS
#define FSM_REGEX_STATE_ID_BITS 32
#endif

#if FSM_REGEX_STATE_ID_BITS <= 32
typedef namespace_std uint32_t stateid_t;
#else
typedef namespace_std uint64_t stateid_t;
#endif

#undef namespace_std

#endif // SIZES_H
