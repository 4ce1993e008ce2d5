#ifndef TAGIO_H
#define TAGIO_H

/**
 * Types and methods to read, transform and write auxiliary fields
 * (tags) of SAM/BAM alignment records.
 */
#include "tagio/TagName.hpp"
#include "tagio/TagStore.hpp"
#include "tagio/TagTransform.hpp"
#include "tagio/TagValue.hpp"

#endif /* TAGIO_H */
