#pragma once

#include<string>

int parse_tz(const std::string&tz);

std::string fmt_tz(int off_min);

struct IsoTime{
	double ts=0.0;
	int tz_off=0;
	bool has_tz=false;
};

IsoTime parse_iso(const std::string&text,const std::string&default_tz);

// "@<seconds>" or a bare number is Unix time, anything else ISO-8601
IsoTime parse_time(const std::string&text,const std::string&default_tz);

std::string fmt_iso(double ts,int off_min,bool with_ms=true);

// minutes as [-]HH:MM:SS.s
std::string fmt_hms(double minutes);
