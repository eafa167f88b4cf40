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

#ifndef SEMVIEW_NLP_VIEWS_EXTRACTOR_PARAMS_H_
#define SEMVIEW_NLP_VIEWS_EXTRACTOR_PARAMS_H_

#include <string>
#include <vector>

#include "semview/base/status.h"
#include "semview/base/types.h"

namespace semview {
namespace nlp {

// Named construction parameters for feature extractors. Values are stored as
// strings and converted by the typed getters, which report values that cannot
// be converted as INVALID_CONFIGURATION errors.
class ExtractorParams {
 public:
  // Parameter name and value.
  struct Parameter {
    Parameter(const string &name, const string &value)
        : name(name), value(value) {}
    string name;
    string value;
  };

  // Adds parameter. Later values override earlier values for the same name.
  void Add(const string &name, const string &value);
  void Add(const string &name, const char *value);
  void Add(const string &name, int value);
  void Add(const string &name, bool value);

  // Checks if parameter has been set.
  bool Has(const string &name) const { return Find(name) != nullptr; }

  // Gets parameter value or the default value if the parameter is not set.
  Status Get(const string &name, const string &defval, string *value) const;
  Status Get(const string &name, int defval, int *value) const;
  Status Get(const string &name, bool defval, bool *value) const;

  // Gets integer parameter which must be set.
  Status GetRequired(const string &name, int *value) const;

  // Returns all parameters in the order they were added.
  const std::vector<Parameter> &parameters() const { return parameters_; }

 private:
  // Returns the latest value for parameter or null if it is not set.
  const string *Find(const string &name) const;

  std::vector<Parameter> parameters_;
};

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_VIEWS_EXTRACTOR_PARAMS_H_
