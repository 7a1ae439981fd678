#pragma once

inline std::string message_text(
	const Evaluation &evaluation,
	std::string &&text,
	size_t index) {

	return text;
}

template<typename... Args>
std::string message_text(
	const Evaluation &evaluation,
	std::string &&text,
	size_t index,
	const BaseExpressionRef &arg,
	const Args&... args) {

	std::string new_text(text);
	const std::string placeholder(message_placeholder(index));

	const auto pos = new_text.find(placeholder);
	if (pos != std::string::npos) {
		new_text = new_text.replace(pos, placeholder.length(), evaluation.format_output(arg));
	}

	return message_text(evaluation, std::move(new_text), index + 1, args...);
}

template<typename... Args>
void Evaluation::message(const SymbolRef &name, const char *tag, const Args&... args) const {
	const std::string *text_template = context.message(name.get(), tag);

	if (!text_template) {
		text_template = context.message(symbols.General.get(), tag);
	}

	if (text_template) {
		std::string text(*text_template);
		write_message(name.get(), tag, message_text(*this, std::move(text), 1, args...));
	}
}
