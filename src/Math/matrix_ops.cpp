#include "copyright.h"
#include "matrix_ops.h"

namespace conformix {
namespace stmath {

//-------------------------------------------------------------------------------------------------
void checkMatrixDimensions(const size_t rows, const size_t columns, const size_t s_a,
                           const char* caller, const char* label) {
  if (rows == 0LLU || columns == 0LLU) {
    rtErr("Matrix " + std::string(label) + " of dimensions " + std::to_string(rows) + " x " +
          std::to_string(columns) + " is invalid.", caller);
  }
  if (rows * columns != s_a) {
    rtErr(errors::ErrorKind::SHAPE_MISMATCH, "Matrix " + std::string(label) + " holds " +
          std::to_string(s_a) + " elements, inconsistent with dimensions " +
          std::to_string(rows) + " x " + std::to_string(columns) + ".", caller);
  }
}

} // namespace stmath
} // namespace conformix
