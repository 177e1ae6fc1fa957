#pragma once

#include<iosfwd>
#include<string>
#include<vector>

std::string js_escape(const std::string&s);

// Streaming JSON emitter. Misuse (a value without a key inside an object,
// unbalanced ends, a second root) throws std::logic_error.
class JsonWriter{
  public:
	explicit JsonWriter(std::ostream&os,bool pretty=true,int ind_size=2);

	void obj_begin(){ open('{'); }
	void obj_end(){ close('}'); }
	void arr_begin(){ open('['); }
	void arr_end(){ close(']'); }

	void key(const std::string&name);

	void value(const std::string&v);
	void value(const char*v);
	// non-finite doubles are written as null
	void value(double v,int prec=17);
	void value(int v){ raw(std::to_string(v)); }
	void value(long v){ raw(std::to_string(v)); }
	void value(bool v){ raw(v?"true":"false"); }
	void null_val(){ raw("null"); }

	template<typename T>
	void field(const std::string&name,const T&v){
		key(name);
		value(v);
	}

	void field(const std::string&name,double v,int prec){
		key(name);
		value(v,prec);
	}

	// true once the root value is closed
	bool done() const{ return root_done_&&frames_.empty(); }

  private:
	struct Frame{
		char close;
		std::size_t items;
		bool keyed;
	};

	std::ostream&os_;
	bool pretty_;
	int ind_size_;
	bool root_done_=false;
	std::vector<Frame> frames_;

	void newline();
	void slot();
	void open(char c);
	void close(char c);
	void raw(const std::string&text);
};
