#include "input_device.h"

#include <glog/logging.h>

namespace Roundwatch {

void DryRunInputDevice::Click(const Point& point) {
	LOG(INFO) << "[DryRunInputDevice]: click (" << point.x << "," << point.y << ")";
}

void DryRunInputDevice::SelectAll() {
	LOG(INFO) << "[DryRunInputDevice]: ctrl+a";
}

void DryRunInputDevice::TypeKey(char key) {
	VLOG(1) << "[DryRunInputDevice]: key '" << key << "'";
}

} // namespace Roundwatch
