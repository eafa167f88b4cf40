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

#ifndef SEMVIEW_NLP_VIEWS_TENSOR_H_
#define SEMVIEW_NLP_VIEWS_TENSOR_H_

#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

#include "semview/base/types.h"

namespace semview {
namespace nlp {

// Tensor shape.
class Shape {
 public:
  Shape() {}
  Shape(const std::vector<int> &dims) : dims_(dims) {}
  Shape(std::initializer_list<int> dims) : dims_(dims) {}

  // Add dimension to shape.
  void add(int size) { dims_.push_back(size); }

  // Insert dimension before dimension d.
  void insert(int d, int size) { dims_.insert(dims_.begin() + d, size); }

  // Set size of dimension.
  void set(int d, int size) { dims_[d] = size; }

  // Return transposed shape.
  Shape transposed() const {
    Shape t;
    for (int d = rank() - 1; d >= 0; --d) t.add(dim(d));
    return t;
  }

  // Return the rank of the shape, i.e. the number of dimensions.
  int rank() const { return dims_.size(); }

  // Return size of dimension.
  int dim(int d) const { return dims_[d]; }

  // Return all dimensions.
  const std::vector<int> &dims() const { return dims_; }

  // Return the total number of elements.
  int elements() const { return outer(rank()); }

  // Return the number of elements before dimension d, i.e. the product of the
  // sizes of dimensions [0;d[.
  int outer(int d) const {
    int n = 1;
    for (int i = 0; i < d; ++i) n *= dims_[i];
    return n;
  }

  // Return the number of elements after dimension d, i.e. the product of the
  // sizes of dimensions ]d;rank[.
  int inner(int d) const {
    int n = 1;
    for (int i = d + 1; i < rank(); ++i) n *= dims_[i];
    return n;
  }

  // Compare shapes.
  bool operator==(const Shape &other) const { return dims_ == other.dims_; }
  bool operator!=(const Shape &other) const { return dims_ != other.dims_; }

  // Return shape as string, e.g. [2x6].
  string ToString() const;

 private:
  std::vector<int> dims_;
};

std::ostream &operator<<(std::ostream &out, const Shape &shape);

// Dense row-major tensor of 32-bit integers.
class Tensor {
 public:
  // Create empty tensor.
  Tensor() {}

  // Create tensor filled with value.
  explicit Tensor(const Shape &shape, int32 value = 0)
      : shape_(shape), data_(shape.elements(), value) {}

  // Create rank 1 tensor with values.
  static Tensor FromVector(const std::vector<int32> &values);

  // Create rank 2 tensor from rows. All rows must have the same length.
  static Tensor FromRows(const std::vector<std::vector<int32>> &rows);

  // Tensor shape.
  const Shape &shape() const { return shape_; }
  int rank() const { return shape_.rank(); }
  int dim(int d) const { return shape_.dim(d); }
  int size() const { return data_.size(); }

  // Element data.
  int32 *data() { return data_.data(); }
  const int32 *data() const { return data_.data(); }
  const std::vector<int32> &values() const { return data_; }

  // Element access for rank 1 tensors.
  int32 &at(int i) { return data_[i]; }
  int32 at(int i) const { return data_[i]; }

  // Element access for rank 2 tensors.
  int32 &at(int r, int c) { return data_[r * shape_.dim(1) + c]; }
  int32 at(int r, int c) const { return data_[r * shape_.dim(1) + c]; }

  // Returns the values of the rank 2 tensor at position index along the axis,
  // i.e. a row for axis 0 and a column for axis 1.
  std::vector<int32> Slice(int axis, int index) const;

  // Returns tensor with a new dimension of size 1 inserted before axis.
  Tensor ExpandDims(int axis) const;

  // Concatenates tensors along axis. All tensors must have the same rank and
  // the same dimensions except along the axis.
  static Tensor Concat(const std::vector<Tensor> &tensors, int axis);

  // Returns tensor tiled along axis to have exactly count elements in this
  // dimension. Position k along the axis is a copy of position k mod n of
  // this tensor, where n is the size of the axis.
  Tensor Repeat(int axis, int count) const;

  // Returns transposed rank 2 tensor.
  Tensor Transposed() const;

  // Compare tensors.
  bool operator==(const Tensor &other) const {
    return shape_ == other.shape_ && data_ == other.data_;
  }
  bool operator!=(const Tensor &other) const { return !(*this == other); }

  // Return tensor as a nested list, e.g. [[0,2,2],[1,1,1]].
  string ToString() const;

 private:
  // Outputs the nested list for dimension d starting at element offset.
  void Print(std::ostream &out, int d, int offset) const;

  Shape shape_;
  std::vector<int32> data_;
};

std::ostream &operator<<(std::ostream &out, const Tensor &tensor);

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_VIEWS_TENSOR_H_
