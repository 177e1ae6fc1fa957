#include "pillar/errors.hpp"

const char*err_name(ErrKind kind){
	switch(kind){
	case ErrKind::NONE:
		return "none";
	case ErrKind::RANGE:
		return "RangeError";
	case ErrKind::COMBO:
		return "InvalidCombination";
	case ErrKind::CONVERGE:
		return "ConvergenceError";
	case ErrKind::AMBIGUOUS:
		return "AmbiguousWindow";
	case ErrKind::OUT_OF_RANGE:
		return "OutOfRange";
	case ErrKind::PROVIDER:
		return "ProviderFailure";
	default:
		return "Error";
	}
}
