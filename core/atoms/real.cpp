#include <sstream>
#include <iomanip>
#include <limits>
#include <cmath>

#include "core/atoms/real.h"
#include "core/symbol.h"

std::string format_machine_real(machine_real_t value) {
	if (std::isnan(value)) {
		return "Indeterminate";
	} else if (std::isinf(value)) {
		return value > 0 ? "Infinity" : "-Infinity";
	}

	std::ostringstream s;
	s << std::setprecision(std::numeric_limits<machine_real_t>::digits10 + 1) << value;
	std::string text = s.str();
	if (text.find_first_of(".e") == std::string::npos) {
		text += ".";
	}
	return text;
}

std::string MachineReal::debugform() const {
    return format_machine_real(value);
}

BaseExpressionRef MachineReal::head() const {
    return system_symbols().Real;
}
