#pragma once

#include<stdexcept>
#include<string>

enum class ErrKind{
	NONE,
	RANGE,
	COMBO,
	CONVERGE,
	AMBIGUOUS,
	OUT_OF_RANGE,
	PROVIDER,
	OTHER
};

const char*err_name(ErrKind kind);

struct PillarError : std::runtime_error{
	ErrKind kind;

	PillarError(ErrKind k,const std::string&msg)
		: std::runtime_error(msg),kind(k){}
};

struct RangeError : PillarError{
	explicit RangeError(const std::string&msg)
		: PillarError(ErrKind::RANGE,msg){}
};

struct InvalidCombination : PillarError{
	explicit InvalidCombination(const std::string&msg)
		: PillarError(ErrKind::COMBO,msg){}
};

struct ConvergenceError : PillarError{
	explicit ConvergenceError(const std::string&msg)
		: PillarError(ErrKind::CONVERGE,msg){}
};

struct AmbiguousWindow : PillarError{
	int crossings;

	AmbiguousWindow(const std::string&msg,int n)
		: PillarError(ErrKind::AMBIGUOUS,msg),crossings(n){}
};

struct OutOfRange : PillarError{
	explicit OutOfRange(const std::string&msg)
		: PillarError(ErrKind::OUT_OF_RANGE,msg){}
};

struct ProviderFailure : PillarError{
	explicit ProviderFailure(const std::string&msg)
		: PillarError(ErrKind::PROVIDER,msg){}
};
