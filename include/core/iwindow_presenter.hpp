#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

struct GridLayout {
  std::string name; // "1x1", "2x1", ..., "grid"
  int rows = 1;
  int columns = 1;
};

// IWindowPresenter: displays the sessions a group launch brought up.
class IWindowPresenter {
public:
  virtual ~IWindowPresenter() = default;
  virtual void PresentGroup(const std::string &groupId,
                            const std::vector<ProfileId> &connected,
                            const GridLayout &layout) = 0;
};
