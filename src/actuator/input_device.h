#ifndef ROUNDWATCH_ACTUATOR_INPUT_DEVICE_H_
#define ROUNDWATCH_ACTUATOR_INPUT_DEVICE_H_

#include <string>

#include "common/types.h"

namespace Roundwatch {

/**
 * Pointer and keyboard primitives. Only the input actuator thread calls these.
 * Failures throw ActuatorError.
 */
class InputDevice {
public:
	virtual ~InputDevice() = default;

	/// Move to an absolute screen point and press/release the left button.
	virtual void Click(const Point& point) = 0;
	/// Ctrl+A on the focused field.
	virtual void SelectAll() = 0;
	/// One keystroke. Digits and '.' are required.
	virtual void TypeKey(char key) = 0;
	virtual std::string name() const = 0;
};

/// Logs every primitive and touches nothing.
class DryRunInputDevice : public InputDevice {
public:
	void Click(const Point& point) override;
	void SelectAll() override;
	void TypeKey(char key) override;
	std::string name() const override { return "dry_run"; }
};

} // namespace Roundwatch

#endif // ROUNDWATCH_ACTUATOR_INPUT_DEVICE_H_
