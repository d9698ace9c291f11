// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace stmath {

//-------------------------------------------------------------------------------------------------
template <typename TSum, typename TBase>
TSum sum(const TBase* v, const size_t vlen) {
  TSum total = 0;
  for (size_t i = 0; i < vlen; i++) {
    total += v[i];
  }
  return total;
}

//-------------------------------------------------------------------------------------------------
template <typename TSum, typename TBase>
TSum sum(const std::vector<TBase> &v) {
  return sum<TSum>(v.data(), v.size());
}

//-------------------------------------------------------------------------------------------------
template <typename TSum, typename TBase>
std::vector<TSum> sumRows(const std::vector<TBase> &v, const size_t row_length,
                          const size_t row_count) {
  if (row_length * row_count != v.size()) {
    rtErr("A stack of " + std::to_string(row_count) + " rows, each of length " +
          std::to_string(row_length) + ", cannot be formed from " + std::to_string(v.size()) +
          " elements.", "sumRows");
  }
  std::vector<TSum> result(row_length, 0);
  for (size_t i = 0; i < row_count; i++) {
    const TBase* row_ptr = &v[i * row_length];
    for (size_t j = 0; j < row_length; j++) {
      result[j] += row_ptr[j];
    }
  }
  return result;
}

} // namespace stmath
} // namespace conformix
