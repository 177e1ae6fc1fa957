#pragma once

#if defined(_WIN32)
#if defined(PILLAR_BUILD_DLL)
#define PILLAR_API __declspec(dllexport)
#elif defined(PILLAR_USE_DLL)
#define PILLAR_API __declspec(dllimport)
#else
#define PILLAR_API
#endif
#define PILLAR_CALL __cdecl
#else
#define PILLAR_API
#define PILLAR_CALL
#endif

#ifdef __cplusplus
extern "C"{
#endif

/* Error kinds returned by pillar_convert. */
enum{
	PILLAR_OK=0,
	PILLAR_ERR_RANGE=1,
	PILLAR_ERR_COMBO=2,
	PILLAR_ERR_CONVERGE=3,
	PILLAR_ERR_AMBIGUOUS=4,
	PILLAR_ERR_OUT_OF_RANGE=5,
	PILLAR_ERR_PROVIDER=6,
	PILLAR_ERR_OTHER=7
};

PILLAR_API const char*PILLAR_CALL pillar_tool_ver(void);
PILLAR_API const char*PILLAR_CALL pillar_last_error(void);
PILLAR_API void PILLAR_CALL pillar_clear_error(void);

/* Runs the command line tool in-process; returns its exit code. */
PILLAR_API int PILLAR_CALL pillar_run(int argc,const char*const*argv);

/* Year, month, day and hour pillar values (0..59) of a Unix time seen from
   lon, with the series provider and default settings. out_offset_min may
   be null. */
PILLAR_API int PILLAR_CALL pillar_convert(double ts,double lon,
										  int out_values[4],
										  double*out_offset_min);

#ifdef __cplusplus
}
#endif
