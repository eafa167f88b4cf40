// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "semview/nlp/views/tensor.h"

#include <algorithm>
#include <sstream>

#include "semview/base/logging.h"

namespace semview {
namespace nlp {

string Shape::ToString() const {
  string str = "[";
  for (int d = 0; d < rank(); ++d) {
    if (d > 0) str.push_back('x');
    str.append(std::to_string(dim(d)));
  }
  str.push_back(']');
  return str;
}

std::ostream &operator<<(std::ostream &out, const Shape &shape) {
  out << shape.ToString();
  return out;
}

Tensor Tensor::FromVector(const std::vector<int32> &values) {
  Tensor t;
  t.shape_.add(values.size());
  t.data_ = values;
  return t;
}

Tensor Tensor::FromRows(const std::vector<std::vector<int32>> &rows) {
  int width = rows.empty() ? 0 : rows[0].size();
  Tensor t(Shape({static_cast<int>(rows.size()), width}));
  int32 *p = t.data();
  for (const auto &row : rows) {
    CHECK_EQ(row.size(), width) << "Ragged rows";
    p = std::copy(row.begin(), row.end(), p);
  }
  return t;
}

std::vector<int32> Tensor::Slice(int axis, int index) const {
  CHECK_EQ(rank(), 2);
  CHECK(axis == 0 || axis == 1) << axis;
  CHECK_GE(index, 0);
  CHECK_LT(index, dim(axis));
  std::vector<int32> slice;
  if (axis == 0) {
    for (int c = 0; c < dim(1); ++c) slice.push_back(at(index, c));
  } else {
    for (int r = 0; r < dim(0); ++r) slice.push_back(at(r, index));
  }
  return slice;
}

Tensor Tensor::ExpandDims(int axis) const {
  CHECK_GE(axis, 0);
  CHECK_LE(axis, rank());
  Tensor t;
  t.shape_ = shape_;
  t.shape_.insert(axis, 1);
  t.data_ = data_;
  return t;
}

Tensor Tensor::Concat(const std::vector<Tensor> &tensors, int axis) {
  CHECK(!tensors.empty());
  const Shape &first = tensors[0].shape();
  CHECK_GE(axis, 0);
  CHECK_LT(axis, first.rank());

  // Compute output shape.
  Shape shape = first;
  int total = 0;
  for (const Tensor &t : tensors) {
    CHECK_EQ(t.rank(), first.rank()) << "Rank mismatch in concat";
    for (int d = 0; d < first.rank(); ++d) {
      if (d != axis) {
        CHECK_EQ(t.dim(d), first.dim(d))
            << "Shape mismatch in concat: " << t.shape() << " vs. " << first;
      }
    }
    total += t.dim(axis);
  }
  shape.set(axis, total);

  // Each input contributes one contiguous block per outer position.
  Tensor result(shape);
  int outer = first.outer(axis);
  int inner = first.inner(axis);
  int32 *dst = result.data();
  for (int o = 0; o < outer; ++o) {
    for (const Tensor &t : tensors) {
      int block = t.dim(axis) * inner;
      const int32 *src = t.data() + o * block;
      dst = std::copy(src, src + block, dst);
    }
  }
  return result;
}

Tensor Tensor::Repeat(int axis, int count) const {
  CHECK_GE(axis, 0);
  CHECK_LT(axis, rank());
  CHECK_GE(count, 0);
  int n = dim(axis);
  CHECK(n > 0 || count == 0) << "Cannot repeat empty axis";

  Shape shape = shape_;
  shape.set(axis, count);
  Tensor result(shape);
  int outer = shape_.outer(axis);
  int inner = shape_.inner(axis);
  int32 *dst = result.data();
  for (int o = 0; o < outer; ++o) {
    for (int k = 0; k < count; ++k) {
      const int32 *src = data() + (o * n + k % n) * inner;
      dst = std::copy(src, src + inner, dst);
    }
  }
  return result;
}

Tensor Tensor::Transposed() const {
  CHECK_EQ(rank(), 2);
  Tensor t(shape_.transposed());
  for (int r = 0; r < dim(0); ++r) {
    for (int c = 0; c < dim(1); ++c) {
      t.at(c, r) = at(r, c);
    }
  }
  return t;
}

void Tensor::Print(std::ostream &out, int d, int offset) const {
  out << "[";
  if (d == rank() - 1) {
    for (int i = 0; i < dim(d); ++i) {
      if (i > 0) out << ",";
      out << data_[offset + i];
    }
  } else {
    int stride = shape_.inner(d);
    for (int i = 0; i < dim(d); ++i) {
      if (i > 0) out << ",";
      Print(out, d + 1, offset + i * stride);
    }
  }
  out << "]";
}

string Tensor::ToString() const {
  if (rank() == 0) return data_.empty() ? "[]" : std::to_string(data_[0]);
  std::ostringstream out;
  Print(out, 0, 0);
  return out.str();
}

std::ostream &operator<<(std::ostream &out, const Tensor &tensor) {
  out << tensor.ToString();
  return out;
}

}  // namespace nlp
}  // namespace semview
