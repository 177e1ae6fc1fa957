#pragma once

#include<cmath>

constexpr double PI=3.141592653589793238462643383279502884;
constexpr double TWO_PI=2.0*PI;
constexpr double DEG2RAD=PI/180.0;
constexpr double RAD2DEG=180.0/PI;

constexpr double AU_KM=149597870.7;
constexpr double SEC_DAY=86400.0;
constexpr double C_AUDAY=173.144632674;

constexpr double JD_UNIX=2440587.5;
constexpr double JD_J2000=2451545.0;

// mean tropical year
constexpr double YEAR_DAYS=365.242189;
constexpr double YEAR_SEC=YEAR_DAYS*SEC_DAY;

constexpr double MIN_PER_DEG=4.0;

struct Vec3{
	double x,y,z;
	Vec3() : x(0.0),y(0.0),z(0.0){}
	Vec3(double xx,double yy,double zz) : x(xx),y(yy),z(zz){}

	Vec3 operator+(const Vec3&b) const{ return Vec3(x+b.x,y+b.y,z+b.z); }
	Vec3 operator-(const Vec3&b) const{ return Vec3(x-b.x,y-b.y,z-b.z); }
	Vec3 operator*(double s) const{ return Vec3(x*s,y*s,z*s); }
	Vec3 operator/(double s) const{ return Vec3(x/s,y/s,z/s); }

	double norm() const{ return std::sqrt(x*x+y*y+z*z); }

	static double dot(const Vec3&a,const Vec3&b){
		return a.x*b.x+a.y*b.y+a.z*b.z;
	}
};

inline Vec3 operator*(double s,const Vec3&v){ return v*s; }

struct Mat3{
	double m[3][3];

	Mat3(){
		for(int i=0;i<3;++i){
			for(int j=0;j<3;++j){
				m[i][j]=0.0;
			}
		}
	}

	Vec3 operator*(const Vec3&v) const{
		return Vec3(m[0][0]*v.x+m[0][1]*v.y+m[0][2]*v.z,
					m[1][0]*v.x+m[1][1]*v.y+m[1][2]*v.z,
					m[2][0]*v.x+m[2][1]*v.y+m[2][2]*v.z);
	}

	Mat3 operator*(const Mat3&b) const{
		Mat3 r;
		for(int i=0;i<3;++i){
			for(int j=0;j<3;++j){
				double s=0.0;
				for(int k=0;k<3;++k){
					s+=m[i][k]*b.m[k][j];
				}
				r.m[i][j]=s;
			}
		}
		return r;
	}
};

// [0,360)
double norm360(double deg);

// (-180,180]
double norm180(double deg);

long floor_div(long a,long b);

long floor_mod(long a,long b);

double greg2jd(int year,int month,int day,int hour=0,int minute=0,
			   double second=0.0);

void jd2greg(double jd,int&year,int&month,int&day,int&hour,int&minute,
			 double&second);

inline double unix2jd(double ts){ return JD_UNIX+ts/SEC_DAY; }

inline double jd2unix(double jd){ return (jd-JD_UNIX)*SEC_DAY; }

// Broken-down civil time at a fixed offset from UTC.
struct CivilDT{
	int year,month,day;
	int hour,minute;
	double second;
	int off_min;

	CivilDT();

	static CivilDT from_unix(double ts,int off_min=0);
};

double unix_of(int year,int month,int day,int hour=0,int minute=0,
			   double second=0.0,int off_min=0);
