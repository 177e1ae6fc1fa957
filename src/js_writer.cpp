#include "pillar/js_writer.hpp"

#include<cmath>
#include<cstdio>
#include<iomanip>
#include<ostream>
#include<sstream>
#include<stdexcept>

std::string js_escape(const std::string&s){
	std::string out;
	out.reserve(s.size()+2);
	for(unsigned char c : s){
		if(c=='"'||c=='\\'){
			out+='\\';
			out+=static_cast<char>(c);
		}else if(c=='\n'){
			out+="\\n";
		}else if(c=='\r'){
			out+="\\r";
		}else if(c=='\t'){
			out+="\\t";
		}else if(c<0x20){
			char buf[8];
			std::snprintf(buf,sizeof(buf),"\\u%04x",static_cast<unsigned>(c));
			out+=buf;
		}else{
			out+=static_cast<char>(c);
		}
	}
	return out;
}

JsonWriter::JsonWriter(std::ostream&os,bool pretty,int ind_size)
	: os_(os),pretty_(pretty),ind_size_(ind_size<0?0:ind_size){}

void JsonWriter::newline(){
	if(pretty_){
		os_<<'\n'<<std::string(frames_.size()*ind_size_,' ');
	}
}

// position the stream for the next value: root, array item, or the value
// half of an object member
void JsonWriter::slot(){
	if(frames_.empty()){
		if(root_done_){
			throw std::logic_error("multiple JSON roots");
		}
		root_done_=true;
		return;
	}
	Frame&f=frames_.back();
	if(f.close=='}'){
		if(!f.keyed){
			throw std::logic_error("value in object requires key()");
		}
		f.keyed=false;
		return;
	}
	if(f.items++>0){
		os_<<',';
	}
	newline();
}

void JsonWriter::open(char c){
	slot();
	os_<<c;
	frames_.push_back({c=='{'?'}':']',0,false});
}

void JsonWriter::close(char c){
	if(frames_.empty()||frames_.back().close!=c){
		throw std::logic_error(std::string("unbalanced '")+c+"'");
	}
	if(frames_.back().keyed){
		throw std::logic_error("object key missing value");
	}
	std::size_t items=frames_.back().items;
	frames_.pop_back();
	if(items>0){
		newline();
	}
	os_<<c;
}

void JsonWriter::key(const std::string&name){
	if(frames_.empty()||frames_.back().close!='}'){
		throw std::logic_error("key() outside object");
	}
	Frame&f=frames_.back();
	if(f.keyed){
		throw std::logic_error("previous key missing value");
	}
	if(f.items++>0){
		os_<<',';
	}
	newline();
	os_<<'"'<<js_escape(name)<<(pretty_?"\": ":"\":");
	f.keyed=true;
}

void JsonWriter::raw(const std::string&text){
	slot();
	os_<<text;
}

void JsonWriter::value(const std::string&v){ raw('"'+js_escape(v)+'"'); }

void JsonWriter::value(const char*v){ value(std::string(v==nullptr?"":v)); }

void JsonWriter::value(double v,int prec){
	if(!std::isfinite(v)){
		null_val();
		return;
	}
	std::ostringstream oss;
	oss<<std::setprecision(prec)<<v;
	raw(oss.str());
}
