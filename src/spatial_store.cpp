#include "spatial_store.hpp"
#include "store_io.hpp"

namespace footprint {

spatial_store::~spatial_store() {
}

std::ostream &operator<<(std::ostream &out, query_status status) {
  switch (status) {
  case query_status::store_error: out << "Store Error"; break;
  case query_status::timeout:     out << "Timeout";     break;
  default:
    out << "*** Unknown status ***";
  }
  return out;
}

std::ostream &operator<<(std::ostream &out, const query_error &err) {
  return out << err.status << ": " << err.message;
}

} // namespace footprint
