#ifndef FOOTPRINT_STORE_IO_HPP
#define FOOTPRINT_STORE_IO_HPP

#include "spatial_store.hpp"

#include <ostream>

namespace footprint {

std::ostream &operator<<(std::ostream &out, query_status status);
std::ostream &operator<<(std::ostream &out, const query_error &err);

} // namespace footprint

#endif /* FOOTPRINT_STORE_IO_HPP */
