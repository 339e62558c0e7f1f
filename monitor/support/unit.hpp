#pragma once

namespace monitor {

struct Unit {
  friend bool operator==(Unit, Unit) {
    return true;
  }
};

}  // namespace monitor
