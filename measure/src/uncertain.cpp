// Uncertain-value arithmetic split by responsibility.
// Keep include order stable: these fragments form one translation unit.

#include "uncertain_parts/01_digit_adjust.cpp"
#include "uncertain_parts/02_boosted_sqrt.cpp"
#include "uncertain_parts/03_canonical.cpp"
#include "uncertain_parts/04_binary_ops.cpp"
#include "uncertain_parts/05_reducers.cpp"
#include "uncertain_parts/06_stats_and_codec.cpp"
