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

// Registry for component registration. These classes can be used for creating
// registries of components conforming to the same interface. This is useful for
// making a component-based architecture where the specific implementation
// classes can be selected at runtime.
//
// Example:
//  extractor.h:
//
//   class Extractor : public Component<Extractor> {
//    public:
//     virtual int Extract(const Document &document) = 0;
//   };
//
//   #define REGISTER_EXTRACTOR(type, component)
//     REGISTER_COMPONENT_TYPE(Extractor, type, component);
//
//  extractor.cc:
//
//   REGISTER_COMPONENT_REGISTRY("extractor", Extractor);
//
//   class Length : public Extractor {
//    public:
//     int Extract(const Document &document) { return document.length(); }
//   };
//
//   REGISTER_EXTRACTOR("length", Length);
//
//   Extractor *e = Extractor::Create("length");
//   int result = e->Extract(document);
//   delete e;

#ifndef SEMVIEW_BASE_REGISTRY_H_
#define SEMVIEW_BASE_REGISTRY_H_

#include <string.h>
#include <functional>
#include <string>

#include "semview/base/logging.h"
#include "semview/base/types.h"

namespace semview {

// Component metadata with information about name, class, and code location.
class ComponentMetadata {
 public:
  ComponentMetadata(const char *name, const char *class_name, const char *file,
                    int line)
      : name_(name),
        class_name_(class_name),
        file_(file),
        line_(line),
        link_(nullptr) {}

  // Returns component name.
  const char *name() const { return name_; }

  // Returns class name.
  const char *class_name() const { return class_name_; }

  // Returns file name.
  const char *file() const { return file_; }

  // Returns line.
  int line() const { return line_; }

  // Metadata objects can be linked in a list.
  ComponentMetadata *link() const { return link_; }
  void set_link(ComponentMetadata *link) { link_ = link; }

 private:
  // Component name.
  const char *name_;

  // Name of class for component.
  const char *class_name_;

  // Code file and location where the component was registered.
  const char *file_;
  int line_;

  // Link to next metadata object in list.
  ComponentMetadata *link_;
};

// Registry for components. An object can be registered with a type name in the
// registry. The named instances in the registry can be returned using the
// Lookup() method. The components in the registry are put into a linked list
// of components. It is important that the component registry can be statically
// initialized in order not to depend on initialization order.
template <class T> struct ComponentRegistry {
  typedef ComponentRegistry<T> Self;

  // Component registration class.
  class Registrar : public ComponentMetadata {
   public:
    // Registers new component by linking itself into the component list of
    // the registry.
    Registrar(Self *registry, const char *type, const char *class_name,
              const char *file, int line, T *object)
        : ComponentMetadata(type, class_name, file, line), object_(object) {
      set_link(registry->components);
      registry->components = this;
    }

    // Returns component type.
    const char *type() const { return name(); }

    // Returns component object.
    T *object() const { return object_; }

    // Returns the next component in the component list.
    Registrar *next() const { return static_cast<Registrar *>(link()); }

   private:
    // Component object.
    T *object_;
  };

  // Finds registrar for named component in registry. Returns null if the
  // component is not registered.
  const Registrar *Find(const char *type) const {
    Registrar *r = components;
    while (r != nullptr && strcmp(type, r->type()) != 0) r = r->next();
    return r;
  }

  // Finds registrar for named component in registry. Unknown components are
  // fatal errors.
  const Registrar *GetComponent(const char *type) const {
    const Registrar *r = Find(type);
    if (r == nullptr) {
      LOG(FATAL) << "Unknown " << name << " component: " << type;
    }
    return r;
  }

  // Finds a named component in the registry.
  T *Lookup(const char *type) const { return GetComponent(type)->object(); }
  T *Lookup(const string &type) const { return Lookup(type.c_str()); }

  // Textual description of the kind of components in the registry.
  const char *name;

  // Base class name of component type.
  const char *class_name;

  // File and line where the registry is defined.
  const char *file;
  int line;

  // Linked list of registered components.
  Registrar *components;
};

// Base class for registerable components.
template <class T> class Component {
 public:
  // Factory function type.
  typedef std::function<T *()> Factory;

  // Registry type.
  typedef ComponentRegistry<Factory> Registry;

  // Creates a new component instance.
  static T *Create(const string &type) {
    return (*registry()->Lookup(type))();
  }

  // Checks if a component type has been registered.
  static bool Exists(const string &type) {
    return registry()->Find(type.c_str()) != nullptr;
  }

  // Returns registry for class.
  static Registry *registry() { return &registry_; }

 private:
  // Registry for class.
  static Registry registry_;
};

#define REGISTER_COMPONENT_TYPE(base, type, component) \
  static base::Factory __##component##_factory = [] { return new component; }; \
  __attribute__((init_priority(800))) \
  static base::Registry::Registrar __##component##__##registrar( \
      base::registry(), type, #component, __FILE__, __LINE__, \
      &__##component##_factory)

#define REGISTER_COMPONENT_REGISTRY(type, classname) \
  template <> __attribute__((init_priority(900))) \
  classname::Registry semview::Component<classname>::registry_ = { \
      type, #classname, __FILE__, __LINE__, nullptr}

}  // namespace semview

#endif  // SEMVIEW_BASE_REGISTRY_H_
