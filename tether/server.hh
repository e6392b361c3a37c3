// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_SERVER_HH__
#define __TETHER_SERVER_HH__

#include <tether/commands.hh>
#include <tether/transport.hh>

namespace Tether {

/// Serve commands from a Transport, one response line per request line.
class CommandServer {
  Transport          &transport_;
  Runtime            &runtime_;
  ObjectStore        store_;
  Codec              codec_;
  Representer        representer_;
  Commands           commands_;
  Runtime::Evaluator old_evaluator_;
  bool               log_ipc_ = false;
  size_t             n_requests_ = 0;
  void               log             (const String &message) const;
  String             exception_reply (const String &kind, const String &message);
  TETHER_CLASS_NON_COPYABLE (CommandServer);
public:
  explicit     CommandServer (Transport &transport, Runtime &runtime, const Representer &representer = Representer());
  virtual     ~CommandServer ();
  void         log_ipc       (bool enabled)     { log_ipc_ = enabled; }
  ObjectStore& store         ()                 { return store_; }
  size_t       n_requests    () const           { return n_requests_; }
  Value        execute_line  (const String &line);
  String       handle        (const String &line);
  Value        evaluate      (const String &code, const String &origin);
  void         run           ();
};

} // Tether

#endif // __TETHER_SERVER_HH__
