// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_CLASSES_HH__
#define __TETHER_CLASSES_HH__

#include <tether/generator.hh>

namespace Tether {

TETHER_CLASS_DECLS (ArrayIterator);
TETHER_CLASS_DECLS (ArrayObject);

/// Array storage with ArrayAccess and Countable methods.
class ArrayStorage : public Instance, public Representable {
protected:
  ValueA storage_;
  explicit ArrayStorage (const ValueA &array) : storage_ (array) {}
public:
  bool          offsetExists (const Value &offset);
  Value         offsetGet    (const Value &offset);
  void          offsetSet    (const Value &offset, const Value &value);
  void          offsetUnset  (const Value &offset);
  int64         count        ();
  ValueA        getArrayCopy ();
  String        represent    (const Representer &representer, int depth) const override;
};

/// Object wrapper around an array.
class ArrayObject : public ArrayStorage {
public:
  explicit         ArrayObject (const ValueA &array = {}) : ArrayStorage (array) {}
  void             append      (const Value &value);
  ArrayIteratorP   getIterator ();
};

/// Iterator over a copy of an array.
class ArrayIterator : public ArrayStorage {
  size_t position_ = 0;
public:
  explicit ArrayIterator (const ValueA &array = {}) : ArrayStorage (array) {}
  Value    current       ();
  Value    key           ();
  void     next          ();
  void     rewind        ();
  bool     valid         ();
};

/// Invokable object wrapping a callable value.
class ClosureObject : public Instance {
  Value callable_;
public:
  explicit              ClosureObject (const Value &callable) : callable_ (callable) {}
  const Value&          callable      () const  { return callable_; }
  Value                 __invoke      (const ValueS &args);
  static ClosureObjectP fromCallable  (const Value &callable);
};

} // Tether

#endif // __TETHER_CLASSES_HH__
