#include<gtest/gtest.h>

#include<cmath>
#include<cstdio>
#include<filesystem>
#include<fstream>
#include<limits>
#include<sstream>
#include<stdexcept>
#include<vector>

#include "mock_sun.hpp"
#include "pillar/c_api.h"
#include "pillar/cfg.hpp"
#include "pillar/errors.hpp"
#include "pillar/js_writer.hpp"
#include "pillar/math.hpp"
#include "pillar/pillar.hpp"

namespace{

const double PRC_TS=unix_of(1949,10,1,7,0);
const double BEIJING_LON=116.4;

class PillarTest : public ::testing::Test{
  protected:
	SeriesSun sun;
	PillarCfg cfg;
};

}

TEST_F(PillarTest,FoundingDayOfPrc){
	PillarCal cal(sun,cfg);
	CoordSet c=cal.convert(PRC_TS,BEIJING_LON);

	EXPECT_EQ(c.year.value(),25);
	EXPECT_EQ(c.month.value(),9);
	EXPECT_EQ(c.month_ord,7);
	EXPECT_EQ(c.day.value(),0);
	EXPECT_EQ(c.hour.value(),7);
	EXPECT_EQ(c.pillar_year,1949);

	EXPECT_DOUBLE_EQ(c.app.std_mer,120.0);
	EXPECT_NEAR(c.offset_min,-4.2,0.5);
	EXPECT_NEAR(c.app.tod_hours,14.93,0.05);
	EXPECT_EQ(c.app.year,1949);
	EXPECT_EQ(c.app.month,10);
	EXPECT_EQ(c.app.day,1);
	// Bailu, 1949-09-08
	EXPECT_EQ(CivilDT::from_unix(c.month_start).month,9);
	EXPECT_EQ(CivilDT::from_unix(c.month_start).day,8);
}

TEST_F(PillarTest,ExplicitMeridianMatchesInferred){
	PillarCal inferred(sun,cfg);
	cfg.std_mer=120.0;
	PillarCal fixed(sun,cfg);
	CoordSet a=inferred.convert(PRC_TS,BEIJING_LON);
	CoordSet b=fixed.convert(PRC_TS,BEIJING_LON);
	EXPECT_TRUE(a.same_pillars(b));
	EXPECT_DOUBLE_EQ(a.offset_min,b.offset_min);
}

TEST_F(PillarTest,Millennium){
	PillarCal cal(sun,cfg);
	CoordSet c=cal.convert(unix_of(2000,1,1,12,0),0.0);
	EXPECT_EQ(c.day.value(),54);
	// 1999 is Ji-Mao, Lichun 2000 has not come yet
	EXPECT_EQ(c.year.value(),15);
	EXPECT_EQ(c.pillar_year,1999);
}

TEST_F(PillarTest,LichunSwitchesYearAndMonth){
	PillarCal cal(sun,cfg);
	CoordSet before=cal.convert(unix_of(2024,2,4,6,0),BEIJING_LON);
	CoordSet after=cal.convert(unix_of(2024,2,4,11,0),BEIJING_LON);

	EXPECT_EQ(before.year.value(),39);
	EXPECT_EQ(before.month.value(),1);
	EXPECT_EQ(before.month_ord,11);
	EXPECT_EQ(after.year.value(),40);
	EXPECT_EQ(after.month.value(),2);
	EXPECT_EQ(after.month_ord,0);
	EXPECT_DOUBLE_EQ(after.year_start,after.month_start);
	EXPECT_NEAR(after.year_start,unix_of(2024,2,4,8,27),20.0*60.0);
}

TEST_F(PillarTest,DatePolicyUsesStandardClock){
	cfg.year_pol=parse_policy("date:2-4");
	cfg.std_mer=120.0;
	PillarCal cal(sun,cfg);
	CoordSet a=cal.convert(unix_of(2024,2,3,23,0,0.0,480),BEIJING_LON);
	CoordSet b=cal.convert(unix_of(2024,2,4,0,30,0.0,480),BEIJING_LON);
	EXPECT_EQ(a.year.value(),39);
	EXPECT_EQ(b.year.value(),40);
	EXPECT_DOUBLE_EQ(b.year_start,unix_of(2024,2,4,0,0,0.0,480));
}

TEST_F(PillarTest,FifteenDegreesIsOneHour){
	cfg.std_mer=120.0;
	PillarCal cal(sun,cfg);
	for(int k=0;k<24;++k){
		double t=unix_of(2024,6,1)+k*3600.0+k*97.0;
		CoordSet w=cal.convert(t,100.0);
		CoordSet e=cal.convert(t,115.0);
		EXPECT_NEAR(e.offset_min-w.offset_min,60.0,1e-9);
		int step=(e.hour.branch()-w.hour.branch()+BRANCHES)%BRANCHES;
		EXPECT_LE(step,1)<<"hour "<<k;
		EXPECT_EQ(e.year,w.year);
		EXPECT_EQ(e.month,w.month);
	}
}

TEST_F(PillarTest,UtcOffsetTracksLongitudeUnderDefaults){
	PillarCal cal(sun,cfg);
	for(int k=0;k<24;++k){
		double t=unix_of(2024,6,1)+k*3600.0+k*97.0;
		CoordSet w=cal.convert(t,100.0);
		CoordSet e=cal.convert(t,115.0);
		// the inferred meridians differ, the UTC-relative offsets do not
		EXPECT_DOUBLE_EQ(w.app.std_mer,105.0);
		EXPECT_DOUBLE_EQ(e.app.std_mer,120.0);
		EXPECT_NEAR(e.app.utc_off_min-w.app.utc_off_min,60.0,1e-9);
		EXPECT_NEAR(e.app.utc_off_min-e.offset_min,480.0,1e-9);
	}
}

TEST_F(PillarTest,MeanTimeSkipsSolarCorrection){
	cfg.solar_corr=false;
	PillarCal cal(sun,cfg);
	CoordSet c=cal.convert(PRC_TS,BEIJING_LON);
	EXPECT_DOUBLE_EQ(c.offset_min,0.0);
	EXPECT_DOUBLE_EQ(c.app.eot_min,0.0);
	EXPECT_DOUBLE_EQ(c.app.utc_off_min,480.0);
	EXPECT_NEAR(c.app.tod_hours,15.0,1e-9);
	EXPECT_EQ(c.hour.branch(),8);
	EXPECT_DOUBLE_EQ(c.app.day_start,unix_of(1949,10,1,0,0,0.0,480));
	EXPECT_EQ(c.day.value(),0);

	// two minutes after standard midnight, before apparent midnight
	double t=unix_of(1949,10,2,0,2,0.0,480);
	PillarCfg solar_cfg;
	PillarCal solar(sun,solar_cfg);
	EXPECT_EQ(solar.convert(t,BEIJING_LON).day.value(),0);
	EXPECT_EQ(cal.convert(t,BEIJING_LON).day.value(),1);

	AppCfg app;
	set_key(app,"solar_correction","0");
	EXPECT_FALSE(app.pc.solar_corr);
	EXPECT_THROW(set_key(app,"solar_correction","maybe"),
				 std::invalid_argument);
}

TEST_F(PillarTest,HourSlots){
	EXPECT_EQ(PillarCal::hour_slot(0.0),0);
	EXPECT_EQ(PillarCal::hour_slot(0.99),0);
	EXPECT_EQ(PillarCal::hour_slot(1.0),1);
	EXPECT_EQ(PillarCal::hour_slot(12.5),6);
	EXPECT_EQ(PillarCal::hour_slot(22.99),11);
	EXPECT_EQ(PillarCal::hour_slot(23.0),0);
	EXPECT_EQ(PillarCal::hour_slot(23.99),0);
}

TEST_F(PillarTest,LateZiStaysOnCurrentDay){
	PillarCal cal(sun,cfg);
	CoordSet c=cal.convert(PRC_TS,BEIJING_LON);
	CoordSet late=cal.convert(c.app.day_start+23.5*3600.0,BEIJING_LON);
	CoordSet next=cal.convert(c.app.day_start+24.5*3600.0,BEIJING_LON);

	EXPECT_EQ(late.day,c.day);
	EXPECT_EQ(late.hour.branch(),0);
	EXPECT_EQ(late.hour.stem(),cfg.hour_stems[c.day.advance(1).stem()%5]);
	EXPECT_EQ(next.day,c.day.advance(1));
	EXPECT_EQ(next.hour.branch(),0);
	EXPECT_EQ(next.hour.stem(),cfg.hour_stems[next.day.stem()%5]);
	// both halves of the Zi hour carry one pillar
	EXPECT_EQ(late.hour,next.hour);
}

TEST_F(PillarTest,HourPillarAdvancesEveryTwoHours){
	PillarCal cal(sun,cfg);
	double start=cal.convert(PRC_TS,BEIJING_LON).app.day_start;
	int prev=cal.convert(start+0.5*3600.0,BEIJING_LON).hour.value();
	for(int k=1;k<12;++k){
		CoordSet x=cal.convert(start+(2.0*k-0.5)*3600.0,BEIJING_LON);
		EXPECT_EQ(x.hour.value(),(prev+1)%60)<<"+"<<2*k-0.5<<"h";
		prev=x.hour.value();
	}
	// late Zi follows Hai, then the day turns inside the same Zi hour
	CoordSet late=cal.convert(start+23.5*3600.0,BEIJING_LON);
	EXPECT_EQ(late.hour.value(),(prev+1)%60);
	CoordSet chou=cal.convert(start+25.5*3600.0,BEIJING_LON);
	EXPECT_EQ(chou.hour.value(),(late.hour.value()+1)%60);
}

TEST_F(PillarTest,DayAdvancesAtApparentMidnight){
	PillarCal cal(sun,cfg);
	CoordSet c=cal.convert(PRC_TS,BEIJING_LON);
	double m=c.app.day_start;
	EXPECT_EQ(cal.convert(m-0.5,BEIJING_LON).day,c.day.advance(-1));
	EXPECT_EQ(cal.convert(m+0.5,BEIJING_LON).day,c.day);
	// apparent midnight differs from the standard clock's
	EXPECT_GT(std::fabs(m-unix_of(1949,10,1,0,0,0.0,480)),60.0);
}

TEST_F(PillarTest,ColdAndWarmCacheAgree){
	PillarCal warm(sun,cfg);
	CoordSet first=warm.convert(PRC_TS,BEIJING_LON);
	std::size_t cached=warm.cache->size();
	EXPECT_GT(cached,0u);
	CoordSet second=warm.convert(PRC_TS,BEIJING_LON);
	EXPECT_EQ(warm.cache->size(),cached);

	PillarCal cold(sun,cfg);
	CoordSet third=cold.convert(PRC_TS,BEIJING_LON);

	for(const CoordSet*c : {&second,&third}){
		EXPECT_TRUE(first.same_pillars(*c));
		EXPECT_DOUBLE_EQ(first.offset_min,c->offset_min);
		EXPECT_DOUBLE_EQ(first.month_start,c->month_start);
		EXPECT_DOUBLE_EQ(first.year_start,c->year_start);
	}

	PillarCal shared(sun,cfg,warm.cache);
	shared.convert(PRC_TS,BEIJING_LON);
	EXPECT_EQ(warm.cache->size(),cached);

	PillarCfg loose=cfg;
	loose.root_tol=1e-3;
	EXPECT_THROW(PillarCal(sun,loose,warm.cache),InvalidCombination);
	LinearSun other(PRC_TS);
	EXPECT_THROW(PillarCal(other,cfg,warm.cache),InvalidCombination);
}

TEST_F(PillarTest,BatchMatchesSingleConversions){
	std::vector<double> xs;
	for(int k=0;k<40;++k){
		xs.push_back(unix_of(2023,1,1)+k*11.3*SEC_DAY);
	}
	xs[5]=std::numeric_limits<double>::quiet_NaN();
	xs[17]=std::numeric_limits<double>::infinity();

	PillarCal ref(sun,cfg);
	for(int jobs : {1,4}){
		PillarCal cal(sun,cfg);
		std::vector<ConvItem> out=cal.conv_batch(xs,BEIJING_LON,jobs);
		ASSERT_EQ(out.size(),xs.size());
		for(std::size_t i=0;i<xs.size();++i){
			if(i==5||i==17){
				EXPECT_FALSE(out[i].ok());
				EXPECT_EQ(out[i].kind,ErrKind::RANGE);
				EXPECT_FALSE(out[i].error.empty());
				continue;
			}
			ASSERT_TRUE(out[i].ok())<<i<<": "<<out[i].error;
			CoordSet c=ref.convert(xs[i],BEIJING_LON);
			EXPECT_TRUE(out[i].coord->same_pillars(c))<<i;
			EXPECT_DOUBLE_EQ(out[i].coord->at.ts(),xs[i]);
			EXPECT_DOUBLE_EQ(out[i].coord->offset_min,c.offset_min);
		}
	}
}

TEST_F(PillarTest,BatchEmpty){
	PillarCal cal(sun,cfg);
	EXPECT_TRUE(cal.conv_batch({},0.0,4).empty());
}

TEST_F(PillarTest,BadLongitude){
	PillarCal cal(sun,cfg);
	EXPECT_THROW(cal.convert(PRC_TS,190.0),RangeError);
}

TEST_F(PillarTest,OutsideEotWindow){
	cfg.eot_from=unix_of(1900,1,1);
	cfg.eot_to=unix_of(2100,1,1);
	PillarCal cal(sun,cfg);
	EXPECT_NO_THROW(cal.convert(PRC_TS,BEIJING_LON));
	EXPECT_THROW(cal.convert(unix_of(2150,1,1),BEIJING_LON),OutOfRange);

	std::vector<ConvItem> out=
		cal.conv_batch({PRC_TS,unix_of(1850,5,1)},BEIJING_LON,2);
	EXPECT_TRUE(out[0].ok());
	EXPECT_EQ(out[1].kind,ErrKind::OUT_OF_RANGE);
}

TEST(PillarProvider,FailuresPropagate){
	PillarCfg cfg;
	ThrowSun bad;
	PillarCal cal(bad,cfg);
	EXPECT_THROW(cal.convert(PRC_TS,BEIJING_LON),ProviderFailure);

	NanSun nan;
	PillarCal cal2(nan,cfg);
	std::vector<ConvItem> out=cal2.conv_batch({PRC_TS},BEIJING_LON,1);
	EXPECT_EQ(out[0].kind,ErrKind::PROVIDER);
}

TEST(PillarCfgTest,Validation){
	PillarCfg ok;
	EXPECT_NO_THROW(ok.validate());

	PillarCfg c;
	c.std_mer=200.0;
	EXPECT_THROW(c.validate(),RangeError);

	c=PillarCfg();
	c.year_pol.lon=320.0;
	EXPECT_THROW(c.validate(),RangeError);

	c=PillarCfg();
	c.jie_origin=0.0;
	EXPECT_THROW(c.validate(),RangeError);

	c=PillarCfg();
	c.month_stems={{1,3,5,7,9}};
	EXPECT_THROW(c.validate(),InvalidCombination);

	c=PillarCfg();
	c.hour_stems={{0,2,4,6,9}};
	EXPECT_THROW(c.validate(),InvalidCombination);

	c=PillarCfg();
	c.ref.day_val=60;
	EXPECT_THROW(c.validate(),RangeError);

	c=PillarCfg();
	c.scan_step=30.0;
	EXPECT_THROW(c.validate(),RangeError);

	c=PillarCfg();
	c.year_pol=parse_policy("date:2-31");
	EXPECT_THROW(c.validate(),RangeError);
	c.year_pol=parse_policy("date:2-29");
	EXPECT_THROW(c.validate(),RangeError);
	c.year_pol=parse_policy("date:4-31");
	EXPECT_THROW(c.validate(),RangeError);
	c.year_pol=parse_policy("date:2-28");
	EXPECT_NO_THROW(c.validate());
	c.year_pol=parse_policy("date:12-31");
	EXPECT_NO_THROW(c.validate());
}

TEST(PillarCfgTest,PolicyText){
	YearPolicy p=parse_policy("lon:315");
	EXPECT_EQ(p.rule,YearRule::LON);
	EXPECT_DOUBLE_EQ(p.lon,315.0);
	p=parse_policy("date:1-1");
	EXPECT_EQ(p.rule,YearRule::DATE);
	EXPECT_EQ(p.month,1);
	EXPECT_EQ(p.day,1);
	EXPECT_EQ(fmt_policy(p),"date:1-1");
	EXPECT_THROW(parse_policy("315"),std::invalid_argument);
	EXPECT_THROW(parse_policy("sun:315"),std::invalid_argument);
	EXPECT_THROW(parse_policy("date:2"),std::invalid_argument);
}

TEST(PillarCfgTest,LoadFile){
	namespace fs=std::filesystem;
	fs::path path=fs::temp_directory_path()/"pillar_cfg_test.txt";
	{
		std::ofstream ofs(path);
		ofs<<"# local defaults\n"
		   <<"std_meridian = 120\n"
		   <<"year_policy=date:2-4\n"
		   <<"hour_stems=0,2,4,6,8\n"
		   <<"jobs=3\n";
	}
	AppCfg cfg;
	ASSERT_TRUE(load_cfg(cfg,path.string()));
	EXPECT_DOUBLE_EQ(cfg.pc.std_mer,120.0);
	EXPECT_EQ(cfg.pc.year_pol.rule,YearRule::DATE);
	EXPECT_EQ(cfg.jobs,3);

	{
		std::ofstream ofs(path);
		ofs<<"jobs=2\n"
		   <<"no_such_key=1\n";
	}
	AppCfg bad;
	try{
		load_cfg(bad,path.string());
		FAIL()<<"expected std::invalid_argument";
	}catch(const std::invalid_argument&ex){
		EXPECT_NE(std::string(ex.what()).find(":2:"),std::string::npos);
	}
	fs::remove(path);

	AppCfg none;
	EXPECT_FALSE(load_cfg(none,path.string()));
}

TEST(PillarCfgTest,SetKeyRejectsBadValues){
	AppCfg cfg;
	EXPECT_THROW(set_key(cfg,"eot_order","x"),std::invalid_argument);
	EXPECT_THROW(set_key(cfg,"jobs","0"),std::invalid_argument);
	EXPECT_THROW(set_key(cfg,"month_stems","2,4,6"),std::invalid_argument);
	EXPECT_THROW(set_key(cfg,"provider","vsop"),std::invalid_argument);
	set_key(cfg,"std_meridian","");
	EXPECT_TRUE(std::isnan(cfg.pc.std_mer));
	set_key(cfg,"eot_order","0");
	EXPECT_EQ(cfg.pc.eot_order,0);
}

TEST(JsonOut,CompactDocument){
	std::ostringstream oss;
	JsonWriter w(oss,false);
	w.obj_begin();
	w.field("name","a\"b\n");
	w.field("n",3);
	w.field("x",0.25,4);
	w.field("bad",std::nan(""));
	w.key("list");
	w.arr_begin();
	w.value(true);
	w.null_val();
	w.arr_end();
	w.key("empty");
	w.obj_begin();
	w.obj_end();
	w.obj_end();
	EXPECT_TRUE(w.done());
	EXPECT_EQ(oss.str(),"{\"name\":\"a\\\"b\\n\",\"n\":3,\"x\":0.25,"
						"\"bad\":null,\"list\":[true,null],\"empty\":{}}");
	EXPECT_EQ(js_escape(std::string(1,'\x01')),"\\u0001");
}

TEST(JsonOut,PrettyIndent){
	std::ostringstream oss;
	JsonWriter w(oss,true,2);
	w.obj_begin();
	w.key("a");
	w.arr_begin();
	w.value(1);
	w.arr_end();
	w.obj_end();
	EXPECT_EQ(oss.str(),"{\n  \"a\": [\n    1\n  ]\n}");
}

TEST(JsonOut,MisuseThrows){
	std::ostringstream oss;
	JsonWriter w(oss,false);
	w.obj_begin();
	EXPECT_THROW(w.value(1),std::logic_error);
	EXPECT_THROW(w.arr_end(),std::logic_error);
	w.key("k");
	EXPECT_THROW(w.key("j"),std::logic_error);
	EXPECT_THROW(w.obj_end(),std::logic_error);
	w.value(1);
	w.obj_end();
	EXPECT_FALSE(oss.str().empty());
	EXPECT_THROW(w.obj_begin(),std::logic_error);
}

TEST(PillarCApi,Convert){
	int v[4]={-1,-1,-1,-1};
	double off=0.0;
	ASSERT_EQ(pillar_convert(PRC_TS,BEIJING_LON,v,&off),PILLAR_OK);
	EXPECT_EQ(v[0],25);
	EXPECT_EQ(v[1],9);
	EXPECT_EQ(v[2],0);
	EXPECT_EQ(v[3],7);
	EXPECT_NEAR(off,-4.2,0.5);
	EXPECT_EQ(pillar_last_error(),nullptr);

	EXPECT_EQ(pillar_convert(PRC_TS,200.0,v,nullptr),PILLAR_ERR_RANGE);
	ASSERT_NE(pillar_last_error(),nullptr);
	pillar_clear_error();
	EXPECT_EQ(pillar_last_error(),nullptr);

	EXPECT_EQ(pillar_convert(PRC_TS,0.0,nullptr,nullptr),PILLAR_ERR_RANGE);
}

TEST(PillarCApi,Run){
	const char*ver[]={"--version"};
	EXPECT_EQ(pillar_run(1,ver),0);
	const char*bad[]={"frobnicate"};
	EXPECT_EQ(pillar_run(1,bad),2);
	EXPECT_NE(pillar_last_error(),nullptr);
	EXPECT_EQ(pillar_run(-1,nullptr),2);
}
