#pragma once

#include <cstddef>

namespace ainp::db {

// Window over a newest-first listing such as the credit transaction log.
struct Pagination {
  std::size_t limit  = 50;
  std::size_t offset = 0;
};

} // namespace ainp::db
