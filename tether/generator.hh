// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_GENERATOR_HH__
#define __TETHER_GENERATOR_HH__

#include <tether/runtime.hh>

namespace Tether {

/// Suspended iteration, each step of `Step` yields the next key and value or false once exhausted.
class Generator : public Instance {
public:
  using Step = std::function<bool (Value &key, Value &value)>;
  explicit          Generator      (const Step &step);
  Value             current        ();
  Value             key            ();
  void              next           ();
  bool              valid          ();
  void              rewind         ();
  ValueA            advance_triple ();
  static GeneratorP from_array     (const ValueA &array);
  static GeneratorP from_range     (int64 start, int64 end, int64 step);
  static GeneratorP from_value     (const Value &iterable);
private:
  Step  step_;
  Value key_, value_;
  bool  started_ = false;
  bool  finished_ = false;
  bool  moved_ = false;
  void  ensure_started ();
  void  pull           ();
};

} // Tether

#endif // __TETHER_GENERATOR_HH__
